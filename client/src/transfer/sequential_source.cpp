#include "transfer/sequential_source.hpp"

#include <iostream>
#include <vector>

#include "errors.hpp"
#include "log.hpp"

sequential_source::sequential_source(std::unique_ptr<body_reader> body, part_table& parts)
    : m_body(std::move(body)), m_parts(parts), m_cancelled(false), m_done(false) {}

std::optional<completion_record> sequential_source::next_completion() {
    if (m_cancelled || m_done || !m_body)
        return std::nullopt;

    auto claimed = m_parts.claim();
    if (!claimed) {
        m_done = true;
        return std::nullopt;
    }
    const std::size_t index = *claimed;
    const part& planned = m_parts.plan(index);

    std::vector<std::uint8_t> bytes(planned.length);
    std::size_t filled = 0;
    try {
        while (filled < planned.length) {
            if (m_cancelled)
                return std::nullopt;
            std::size_t n = m_body->read(bytes.data() + filled, planned.length - filled);
            if (n == 0)
                return failure(index,
                               "body ended after " + std::to_string(planned.offset + filled) +
                                   " bytes",
                               0);
            filled += n;
        }

        if (index + 1 == m_parts.size()) {
            std::uint8_t extra;
            if (m_body->read(&extra, 1) != 0)
                return failure(index, "body is longer than the probed size", 0);
        }
    } catch (const fetch_error& e) {
        return failure(index, e.what(), e.http_status());
    }

    m_parts.set_state(index, part_state::ready);
    completion_record record;
    record.index = index;
    record.offset = planned.offset;
    record.length = planned.length;
    record.buffer = buffer_lease::detached(std::move(bytes));
    record.attempts = m_parts.attempts(index);
    return record;
}

completion_record sequential_source::failure(std::size_t index, const std::string& message,
                                             int http_status) {
    m_done = true;
    m_parts.set_state(index, part_state::failed);
    std::cerr << "[Sequential] Part " << index << " failed: " << message << std::endl;

    completion_record record;
    record.index = index;
    record.offset = m_parts.plan(index).offset;
    record.length = m_parts.plan(index).length;
    record.attempts = m_parts.attempts(index);
    record.failed = true;
    record.error = message;
    record.http_status = http_status;
    return record;
}

void sequential_source::cancel() {
    m_cancelled = true;
}

void sequential_source::shutdown() {
    m_body.reset();
    URLSTREAM_LOG(std::cout << "[Sequential] Body stream closed" << std::endl);
}
