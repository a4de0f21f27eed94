#include "transfer/assembler.hpp"

#include <iostream>

#include "log.hpp"

assembler::assembler(std::size_t part_count, delivery_order order)
    : m_part_count(part_count), m_order(order), m_next_required(0), m_delivered(0),
      m_seen(part_count, false) {}

bool assembler::accept(completion_record record) {
    if (record.index >= m_part_count || m_seen[record.index]) {
        URLSTREAM_LOG(std::cout << "[Assembler] Discarding duplicate record for part "
                                << record.index << std::endl);
        return false;
    }
    m_seen[record.index] = true;

    if (m_order == delivery_order::unordered)
        m_arrivals.push_back(std::move(record));
    else
        m_holding.emplace(record.index, std::move(record));
    return true;
}

std::optional<completion_record> assembler::next_ready() {
    if (m_order == delivery_order::unordered) {
        if (m_arrivals.empty())
            return std::nullopt;
        completion_record record = std::move(m_arrivals.front());
        m_arrivals.pop_front();
        ++m_delivered;
        return record;
    }

    auto it = m_holding.find(m_next_required);
    if (it == m_holding.end())
        return std::nullopt;
    completion_record record = std::move(it->second);
    m_holding.erase(it);
    ++m_next_required;
    ++m_delivered;
    return record;
}

std::size_t assembler::held() const {
    return m_order == delivery_order::unordered ? m_arrivals.size() : m_holding.size();
}

void assembler::clear() {
    m_holding.clear();
    m_arrivals.clear();
}
