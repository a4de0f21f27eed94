#include "session_config.hpp"

#include <fstream>

#include "errors.hpp"

session_config::session_config()
    : concurrency(4), chunk_size(4ULL * 1024ULL * 1024ULL), pool_size(0), max_retries(5),
      timeout_seconds(60), connect_timeout_seconds(10), backoff_base_ms(100),
      backoff_max_ms(10000) {}

std::size_t session_config::effective_pool_size() const {
    if (pool_size != 0)
        return pool_size;
    return concurrency_enabled() ? 2 * concurrency + 1 : 1;
}

void session_config::validate() const {
    if (chunk_size == 0)
        throw config_error("chunk_size must be greater than zero");
    if (timeout_seconds <= 0)
        throw config_error("timeout_seconds must be greater than zero");
    if (connect_timeout_seconds <= 0)
        throw config_error("connect_timeout_seconds must be greater than zero");
    if (backoff_max_ms < backoff_base_ms)
        throw config_error("backoff_max_ms must not be less than backoff_base_ms");
    if (concurrency_enabled() && effective_pool_size() < concurrency) {
        throw config_error("pool_size (" + std::to_string(effective_pool_size()) +
                           ") must be at least concurrency (" + std::to_string(concurrency) +
                           ")");
    }
}

void to_json(nlohmann::json& j, const session_config& config) {
    if (config.concurrency_enabled())
        j["concurrency"] = config.concurrency;
    else
        j["concurrency"] = "disabled";
    j["chunk_size"] = config.chunk_size;
    j["pool_size"] = config.pool_size;
    j["max_retries"] = config.max_retries;
    j["timeout_seconds"] = config.timeout_seconds;
    j["connect_timeout_seconds"] = config.connect_timeout_seconds;
    j["backoff_base_ms"] = config.backoff_base_ms;
    j["backoff_max_ms"] = config.backoff_max_ms;
}

void from_json(const nlohmann::json& j, session_config& config) {
    if (!j.is_object())
        throw config_error("session configuration must be a JSON object");

    try {
        auto it = j.find("concurrency");
        if (it != j.end()) {
            if (it->is_string()) {
                if (it->get<std::string>() != "disabled")
                    throw config_error("concurrency must be a number or \"disabled\"");
                config.concurrency = session_config::concurrency_disabled;
            } else {
                config.concurrency = it->get<std::size_t>();
            }
        }
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        config.pool_size = j.value("pool_size", config.pool_size);
        config.max_retries = j.value("max_retries", config.max_retries);
        config.timeout_seconds = j.value("timeout_seconds", config.timeout_seconds);
        config.connect_timeout_seconds =
            j.value("connect_timeout_seconds", config.connect_timeout_seconds);
        config.backoff_base_ms = j.value("backoff_base_ms", config.backoff_base_ms);
        config.backoff_max_ms = j.value("backoff_max_ms", config.backoff_max_ms);
    } catch (const nlohmann::json::exception& e) {
        throw config_error(std::string("invalid session configuration: ") + e.what());
    }
}

session_config load_session_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw config_error("cannot open configuration file: " + path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error("failed to parse " + path + ": " + e.what());
    }

    session_config config;
    from_json(j, config);
    config.validate();
    return config;
}
