#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

enum class part_state {
    pending,
    in_flight,
    ready,
    released,
    failed,
};

struct part {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::size_t length = 0;
    part_state state = part_state::pending;
    unsigned attempts = 0;
};

// Splits [0, size) into ceil(size / chunk_size) contiguous parts; only the last may be
// shorter. Throws std::invalid_argument for a zero chunk size.
std::vector<part> plan_parts(std::uint64_t size, std::uint64_t chunk_size);
