#pragma once

#include "net/http.hpp"
#include "net/transport.hpp"
#include "session_config.hpp"

class curl_transport : public transport {
public:
    explicit curl_transport(const session_config& config);

    http_client::response probe(const std::string& url) override;
    http_client::response get_range(const std::string& url, std::uint64_t offset,
                                    std::size_t length, std::uint8_t* dest) override;
    std::unique_ptr<body_reader> open_body(const std::string& url) override;

    static transport_factory factory(const session_config& config);

private:
    http_client m_http;
    long m_connect_timeout_seconds;
    long m_timeout_seconds;
};
