#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "transfer/buffer_pool.hpp"

// Published once per part: either the filled buffer or the reason the part failed.
// A failure that belongs to no part carries fetch_error::no_part as its index.
struct completion_record {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::size_t length = 0;
    buffer_lease buffer;
    unsigned attempts = 0;

    bool failed = false;
    std::string error;
    int http_status = 0;

    const std::uint8_t* data() const {
        return buffer.data();
    }
};
