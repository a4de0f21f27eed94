#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "transfer/chunk_planner.hpp"

// Live state of every planned part. Claims hand out indices in ascending order; state
// and attempt counters are only written by whoever holds the claim.
class part_table {
public:
    explicit part_table(std::vector<part> plan);

    std::size_t size() const {
        return m_plan.size();
    }

    const part& plan(std::size_t index) const {
        return m_plan.at(index);
    }

    // Moves the next pending part to in_flight with its first attempt counted.
    std::optional<std::size_t> claim();

    // Counts another attempt and moves the part back to in_flight. Returns the attempt number.
    unsigned begin_attempt(std::size_t index);

    void set_state(std::size_t index, part_state state);
    part_state state(std::size_t index) const;
    unsigned attempts(std::size_t index) const;

    std::vector<part> snapshot() const;

private:
    std::vector<part> m_plan;
    std::unique_ptr<std::atomic<part_state>[]> m_states;
    std::unique_ptr<std::atomic<unsigned>[]> m_attempts;
    std::atomic<std::size_t> m_next_claim;
};
