#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

class http_client {
public:
    struct response {
        int status_code;                            // 0 when the transfer itself failed
        std::string body;                           // unused by get_into()
        std::map<std::string, std::string> headers; // names lower-cased
        std::size_t bytes_received;
        bool body_overflow;                         // get_into() target was too small
        std::string error;                          // curl error text, empty on success

        response() : status_code(0), bytes_received(0), body_overflow(false) {}

        bool transport_failed() const {
            return status_code == 0;
        }
    };

    struct request {
        std::string url;
        std::map<std::string, std::string> headers;
        bool headers_only; // abandon the transfer once the body starts

        request(const std::string& url) : url(url), headers_only(false) {}
    };

    http_client();
    ~http_client();

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    // Enable move constructor and assignment operator
    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    response get(const request& req);

    // Writes the body straight into [dest, dest + capacity). A larger body fails the
    // transfer with body_overflow set.
    response get_into(const request& req, std::uint8_t* dest, std::size_t capacity);

    // Session management; the handle keeps its connection alive between requests.
    void set_timeout(long timeout_seconds);
    void set_connect_timeout(long timeout_seconds);

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    struct body_sink;
    response perform_request(const request& req, body_sink& sink);
    void parse_response_headers(const std::string& header_string, response& resp);
    void print_request_details(const request& req);
    void print_response_details(const response& resp);
};

// Pull-based GET of a whole resource on a dedicated connection. The transfer is
// paused while the reader falls behind, so memory use stays bounded.
class http_body_stream {
public:
    http_body_stream(const std::string& url, long connect_timeout_seconds,
                     long stall_timeout_seconds);
    ~http_body_stream();

    http_body_stream(const http_body_stream&) = delete;
    http_body_stream& operator=(const http_body_stream&) = delete;

    // Blocks until at least one byte is available. Returns 0 at the end of the body.
    // Throws fetch_error on transport failure or an error status.
    std::size_t read(std::uint8_t* dest, std::size_t capacity);

private:
    class impl;
    std::unique_ptr<impl> pimpl;
};
