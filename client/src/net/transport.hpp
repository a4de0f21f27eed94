#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "net/http.hpp"

// Whole-object body, consumed front to back.
class body_reader {
public:
    virtual ~body_reader() = default;

    // Returns 0 at end of body. Throws fetch_error.
    virtual std::size_t read(std::uint8_t* dest, std::size_t capacity) = 0;
};

// The network operations a download session needs. Each worker process builds
// its own instance from a transport_factory after it has been spawned.
class transport {
public:
    virtual ~transport() = default;

    // Headers of a `Range: bytes=0-0` GET; the body is not consumed.
    virtual http_client::response probe(const std::string& url) = 0;

    // Range GET for [offset, offset + length) written into dest, which holds at least
    // `length` bytes. Status, header and byte count are reported, never thrown.
    virtual http_client::response get_range(const std::string& url, std::uint64_t offset,
                                            std::size_t length, std::uint8_t* dest) = 0;

    // Sequential GET for the whole object.
    virtual std::unique_ptr<body_reader> open_body(const std::string& url) = 0;
};

using transport_factory = std::function<std::unique_ptr<transport>()>;
