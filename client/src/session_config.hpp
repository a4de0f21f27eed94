#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

struct session_config {
    // Synchronous in-process fetch, no worker processes and no buffer pool.
    static constexpr std::size_t concurrency_disabled = 0;

    std::size_t concurrency;        // worker processes, or concurrency_disabled
    std::uint64_t chunk_size;       // bytes per part (and per pool buffer)
    std::size_t pool_size;          // shared buffers; 0 derives 2 * concurrency + 1
    unsigned max_retries;           // retries after the first attempt of a part
    long timeout_seconds;           // curl total timeout per request
    long connect_timeout_seconds;   // curl connect timeout
    unsigned backoff_base_ms;       // delay before the first retry
    unsigned backoff_max_ms;        // ceiling for the retry delay

    session_config();

    bool concurrency_enabled() const {
        return concurrency != concurrency_disabled;
    }

    // Pool size after applying the default.
    std::size_t effective_pool_size() const;

    // Throws config_error.
    void validate() const;
};

void to_json(nlohmann::json& j, const session_config& config);
void from_json(const nlohmann::json& j, session_config& config);

// Reads a JSON object from `path` on top of the defaults. Throws config_error.
session_config load_session_config(const std::string& path);
