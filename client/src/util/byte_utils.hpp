#pragma once

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace byte_utils {

inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};

    int unit_index = 0;
    std::uint64_t scale = 1ULL;
    while (unit_index < 5 && bytes >= scale * 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    double in_unit = static_cast<double>(bytes) / static_cast<double>(scale);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(in_unit < 10.0 ? 2 : (in_unit < 100.0 ? 1 : 0));
    }

    oss << in_unit << ' ' << units[unit_index];
    return oss.str();
}

// Parses "1048576", "512K", "4M", "4MiB", "1G". Suffixes are binary multiples.
inline std::optional<std::uint64_t> parse_bytes(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        ++pos;
    if (pos == 0 || pos > 19)
        return std::nullopt;

    std::uint64_t value = std::stoull(text.substr(0, pos));
    std::string suffix = text.substr(pos);
    for (auto& c : suffix)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (suffix.size() == 3 && suffix.compare(1, 2, "IB") == 0)
        suffix.resize(1);
    else if (suffix.size() == 2 && suffix[1] == 'B')
        suffix.resize(1);

    unsigned shift = 0;
    if (suffix.empty() || suffix == "B")
        shift = 0;
    else if (suffix == "K")
        shift = 10;
    else if (suffix == "M")
        shift = 20;
    else if (suffix == "G")
        shift = 30;
    else
        return std::nullopt;

    if (value > (std::numeric_limits<std::uint64_t>::max() >> shift))
        return std::nullopt;
    return value << shift;
}

} // namespace byte_utils
