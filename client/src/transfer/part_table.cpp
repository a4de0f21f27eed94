#include "transfer/part_table.hpp"

part_table::part_table(std::vector<part> plan)
    : m_plan(std::move(plan)), m_states(new std::atomic<part_state>[m_plan.size()]),
      m_attempts(new std::atomic<unsigned>[m_plan.size()]), m_next_claim(0) {
    for (std::size_t i = 0; i < m_plan.size(); ++i) {
        m_states[i].store(part_state::pending);
        m_attempts[i].store(0);
    }
}

std::optional<std::size_t> part_table::claim() {
    std::size_t index = m_next_claim.fetch_add(1);
    if (index >= m_plan.size()) {
        m_next_claim.store(m_plan.size());
        return std::nullopt;
    }
    begin_attempt(index);
    return index;
}

unsigned part_table::begin_attempt(std::size_t index) {
    m_states[index].store(part_state::in_flight);
    return m_attempts[index].fetch_add(1) + 1;
}

void part_table::set_state(std::size_t index, part_state state) {
    m_states[index].store(state);
}

part_state part_table::state(std::size_t index) const {
    return m_states[index].load();
}

unsigned part_table::attempts(std::size_t index) const {
    return m_attempts[index].load();
}

std::vector<part> part_table::snapshot() const {
    std::vector<part> parts = m_plan;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        parts[i].state = m_states[i].load();
        parts[i].attempts = m_attempts[i].load();
    }
    return parts;
}
