#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <vector>

#include "transfer/completion.hpp"

enum class delivery_order {
    ordered,   // ascending offset, one part after another
    unordered, // completion order
};

// Turns completion records that arrive in any order into the sequence the consumer
// sees. Each part index is handed out exactly once.
class assembler {
public:
    assembler(std::size_t part_count, delivery_order order = delivery_order::ordered);

    // Takes the record. Returns false when it was a duplicate or stale record, whose
    // buffer is released immediately.
    bool accept(completion_record record);

    // Next record that may be handed to the consumer, if one is held.
    std::optional<completion_record> next_ready();

    // Every part has been handed out.
    bool exhausted() const {
        return m_delivered == m_part_count;
    }

    // Ordered mode: index of the part the consumer needs next.
    std::size_t next_required_index() const {
        return m_next_required;
    }

    std::size_t held() const;
    std::size_t delivered() const {
        return m_delivered;
    }

    // Drops every held record, releasing its buffer.
    void clear();

private:
    std::size_t m_part_count;
    delivery_order m_order;
    std::size_t m_next_required;
    std::size_t m_delivered;
    std::vector<bool> m_seen;
    std::map<std::size_t, completion_record> m_holding;
    std::deque<completion_record> m_arrivals;
};
