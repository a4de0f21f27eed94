#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "net/http.hpp"
#include "session_config.hpp"

// Messages exchanged between a controller-side agent and its worker process.
enum class fetch_message_type {
    fetch,  // agent -> worker
    result, // worker -> agent
    stop,   // agent -> worker
};

enum class fetch_status {
    completed,
    transient_error,
    fatal_error,
};

struct fetch_request {
    std::size_t part_index = 0;
    std::uint64_t offset = 0;
    std::size_t length = 0;
    unsigned attempt = 0;    // 1-based
    std::string buffer_name; // named shared buffer to fill from byte 0
};

struct fetch_result {
    std::size_t part_index = 0;
    fetch_status status = fetch_status::fatal_error;
    std::size_t length = 0; // bytes written into the buffer
    int http_status = 0;
    std::string message;
};

NLOHMANN_JSON_SERIALIZE_ENUM(fetch_message_type, {
                                                     {fetch_message_type::fetch, "fetch"},
                                                     {fetch_message_type::result, "result"},
                                                     {fetch_message_type::stop, "stop"},
                                                 })

NLOHMANN_JSON_SERIALIZE_ENUM(fetch_status, {
                                               {fetch_status::completed, "completed"},
                                               {fetch_status::transient_error, "transient"},
                                               {fetch_status::fatal_error, "fatal"},
                                           })

void to_json(nlohmann::json& j, const fetch_request& request);
void from_json(const nlohmann::json& j, fetch_request& request);
void to_json(nlohmann::json& j, const fetch_result& result);
void from_json(const nlohmann::json& j, fetch_result& result);

// 408, 429 and 5xx.
bool is_transient_status(int http_status);

// Maps the outcome of one range GET to a result for `request`.
fetch_result classify_range_response(const fetch_request& request,
                                     const http_client::response& response);

// min(backoff_max, backoff_base * 2^(attempt - 1)) for a 1-based attempt.
std::chrono::milliseconds retry_delay(unsigned attempt, const session_config& config);
