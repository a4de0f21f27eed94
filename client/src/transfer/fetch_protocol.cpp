#include "transfer/fetch_protocol.hpp"

void to_json(nlohmann::json& j, const fetch_request& request) {
    j = nlohmann::json{{"type", fetch_message_type::fetch},
                       {"part", request.part_index},
                       {"offset", request.offset},
                       {"length", request.length},
                       {"attempt", request.attempt},
                       {"buffer", request.buffer_name}};
}

void from_json(const nlohmann::json& j, fetch_request& request) {
    j.at("part").get_to(request.part_index);
    j.at("offset").get_to(request.offset);
    j.at("length").get_to(request.length);
    j.at("attempt").get_to(request.attempt);
    j.at("buffer").get_to(request.buffer_name);
}

void to_json(nlohmann::json& j, const fetch_result& result) {
    j = nlohmann::json{{"type", fetch_message_type::result},
                       {"part", result.part_index},
                       {"status", result.status},
                       {"length", result.length},
                       {"http_status", result.http_status},
                       {"message", result.message}};
}

void from_json(const nlohmann::json& j, fetch_result& result) {
    j.at("part").get_to(result.part_index);
    j.at("status").get_to(result.status);
    j.at("length").get_to(result.length);
    result.http_status = j.value("http_status", 0);
    result.message = j.value("message", "");
}

bool is_transient_status(int http_status) {
    return http_status == 408 || http_status == 429 || (http_status >= 500 && http_status < 600);
}

fetch_result classify_range_response(const fetch_request& request,
                                     const http_client::response& response) {
    fetch_result result;
    result.part_index = request.part_index;
    result.http_status = response.status_code;
    result.length = response.bytes_received;

    if (response.transport_failed()) {
        result.status = fetch_status::transient_error;
        result.message = response.error.empty() ? "transfer failed" : response.error;
        return result;
    }

    const int status = response.status_code;
    if (status == 206 || (status == 200 && request.offset == 0)) {
        if (response.body_overflow) {
            result.status = fetch_status::fatal_error;
            result.message = "server returned more than the requested " +
                             std::to_string(request.length) + " bytes";
        } else if (response.bytes_received == request.length) {
            result.status = fetch_status::completed;
        } else {
            // Occasionally an incomplete part arrives with a success status
            result.status = fetch_status::transient_error;
            result.message = "incomplete part: " + std::to_string(response.bytes_received) +
                             " of " + std::to_string(request.length) + " bytes";
        }
        return result;
    }

    if (status == 200) {
        result.status = fetch_status::fatal_error;
        result.message = "server ignored the range request";
    } else if (status == 416) {
        result.status = fetch_status::fatal_error;
        result.message = "range not satisfiable: bytes " + std::to_string(request.offset) + "-" +
                         std::to_string(request.offset + request.length - 1);
    } else if (is_transient_status(status)) {
        result.status = fetch_status::transient_error;
        result.message = "http status " + std::to_string(status);
    } else {
        result.status = fetch_status::fatal_error;
        result.message = "http status " + std::to_string(status);
    }
    return result;
}

std::chrono::milliseconds retry_delay(unsigned attempt, const session_config& config) {
    std::uint64_t delay = config.backoff_base_ms;
    for (unsigned i = 1; i < attempt && delay < config.backoff_max_ms; ++i) {
        delay *= 2;
    }
    if (delay > config.backoff_max_ms)
        delay = config.backoff_max_ms;
    return std::chrono::milliseconds(delay);
}
