#include "net/curl_transport.hpp"

namespace {
std::string range_header(std::uint64_t offset, std::size_t length) {
    // HTTP Range end is inclusive
    return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
}

class curl_body_reader : public body_reader {
public:
    curl_body_reader(const std::string& url, long connect_timeout_seconds,
                     long stall_timeout_seconds)
        : m_stream(url, connect_timeout_seconds, stall_timeout_seconds) {}

    std::size_t read(std::uint8_t* dest, std::size_t capacity) override {
        return m_stream.read(dest, capacity);
    }

private:
    http_body_stream m_stream;
};
} // namespace

curl_transport::curl_transport(const session_config& config)
    : m_connect_timeout_seconds(config.connect_timeout_seconds),
      m_timeout_seconds(config.timeout_seconds) {
    m_http.set_timeout(config.timeout_seconds);
    m_http.set_connect_timeout(config.connect_timeout_seconds);
}

http_client::response curl_transport::probe(const std::string& url) {
    http_client::request req(url);
    req.headers["Range"] = "bytes=0-0";
    req.headers_only = true;
    return m_http.get(req);
}

http_client::response curl_transport::get_range(const std::string& url, std::uint64_t offset,
                                                std::size_t length, std::uint8_t* dest) {
    http_client::request req(url);
    req.headers["Range"] = range_header(offset, length);
    return m_http.get_into(req, dest, length);
}

std::unique_ptr<body_reader> curl_transport::open_body(const std::string& url) {
    return std::make_unique<curl_body_reader>(url, m_connect_timeout_seconds, m_timeout_seconds);
}

transport_factory curl_transport::factory(const session_config& config) {
    return [config]() -> std::unique_ptr<transport> {
        return std::make_unique<curl_transport>(config);
    };
}
