#include "progress.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "util/byte_utils.hpp"

progress_bar::progress_bar(std::string name, std::uint64_t size, std::ostream& out,
                           std::size_t increments)
    : m_name(std::move(name)), m_size(size), m_out(out),
      m_increments(increments == 0 ? 1 : increments), m_progress(0), m_drawn_increments(0),
      m_drawn(false), m_start(std::chrono::steady_clock::now()) {}

void progress_bar::add(std::uint64_t bytes) {
    if (bytes > m_size - m_progress)
        throw std::logic_error("progress beyond 100% for " + m_name);
    m_progress += bytes;

    if (!m_drawn || completed_increments() > m_drawn_increments)
        draw();
}

void progress_bar::finish() {
    draw();
    m_out << std::endl;
}

std::size_t progress_bar::completed_increments() const {
    if (m_size == 0)
        return m_increments;
    return static_cast<std::size_t>((static_cast<double>(m_progress) / m_size) * m_increments);
}

std::string progress_bar::render(double seconds) const {
    std::size_t done = completed_increments();
    int percent = m_size == 0 ? 100 : static_cast<int>((m_progress * 100) / m_size);

    std::ostringstream line;
    line << m_name << ' ' << std::setw(3) << percent << "% [" << std::string(done, '=')
         << std::string(m_increments - done, ' ') << "] "
         << byte_utils::format_bytes(m_progress) << '/' << byte_utils::format_bytes(m_size) << ' '
         << std::fixed << std::setprecision(2) << seconds << 's';
    return line.str();
}

void progress_bar::draw() {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start);
    m_out << '\r' << render(elapsed.count()) << std::flush;
    m_drawn = true;
    m_drawn_increments = completed_increments();
}
