#include "transfer/chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>

std::vector<part> plan_parts(std::uint64_t size, std::uint64_t chunk_size) {
    if (chunk_size == 0)
        throw std::invalid_argument("chunk size must be greater than zero");

    std::vector<part> parts;
    parts.reserve(static_cast<std::size_t>((size + chunk_size - 1) / chunk_size));
    for (std::uint64_t offset = 0; offset < size; offset += chunk_size) {
        part p;
        p.index = parts.size();
        p.offset = offset;
        p.length = static_cast<std::size_t>(std::min(chunk_size, size - offset));
        parts.push_back(p);
    }
    return parts;
}
