#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

// Single-line terminal progress bar, redrawn each time another increment of the
// object has arrived:
//   name  42% [================                        ] 4.20 MiB/10.00 MiB 1.37s
class progress_bar {
public:
    progress_bar(std::string name, std::uint64_t size, std::ostream& out = std::cout,
                 std::size_t increments = 40);

    // Throws std::logic_error when more than `size` bytes are reported.
    void add(std::uint64_t bytes);

    // Draws the final state and ends the line.
    void finish();

    std::uint64_t progress() const {
        return m_progress;
    }

    std::string render(double seconds) const;

private:
    std::size_t completed_increments() const;
    void draw();

    std::string m_name;
    std::uint64_t m_size;
    std::ostream& m_out;
    std::size_t m_increments;
    std::uint64_t m_progress;
    std::size_t m_drawn_increments;
    bool m_drawn;
    std::chrono::steady_clock::time_point m_start;
};
