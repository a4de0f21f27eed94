#include "transfer/buffer_pool.hpp"

#include <iostream>
#include <stdexcept>

#include "errors.hpp"
#include "log.hpp"

namespace {
const std::string empty_name;
}

buffer_lease::buffer_lease() : m_pool(nullptr), m_slot(0), m_buffer(nullptr) {}

buffer_lease::buffer_lease(buffer_pool* pool, std::size_t slot, shared_buffer* buffer)
    : m_pool(pool), m_slot(slot), m_buffer(buffer) {}

buffer_lease::~buffer_lease() {
    reset();
}

buffer_lease::buffer_lease(buffer_lease&& other) noexcept
    : m_pool(other.m_pool), m_slot(other.m_slot), m_buffer(other.m_buffer),
      m_detached(std::move(other.m_detached)) {
    other.m_pool = nullptr;
    other.m_buffer = nullptr;
}

buffer_lease& buffer_lease::operator=(buffer_lease&& other) noexcept {
    if (this != &other) {
        reset();
        m_pool = other.m_pool;
        m_slot = other.m_slot;
        m_buffer = other.m_buffer;
        m_detached = std::move(other.m_detached);
        other.m_pool = nullptr;
        other.m_buffer = nullptr;
    }
    return *this;
}

buffer_lease buffer_lease::detached(std::vector<std::uint8_t> bytes) {
    buffer_lease lease;
    lease.m_detached = std::make_shared<std::vector<std::uint8_t>>(std::move(bytes));
    return lease;
}

bool buffer_lease::valid() const {
    return m_buffer != nullptr || m_detached != nullptr;
}

std::uint8_t* buffer_lease::data() {
    if (m_detached)
        return m_detached->data();
    return m_buffer ? m_buffer->data() : nullptr;
}

const std::uint8_t* buffer_lease::data() const {
    if (m_detached)
        return m_detached->data();
    return m_buffer ? m_buffer->data() : nullptr;
}

std::size_t buffer_lease::capacity() const {
    if (m_detached)
        return m_detached->size();
    return m_buffer ? m_buffer->capacity() : 0;
}

const std::string& buffer_lease::name() const {
    return m_buffer ? m_buffer->name() : empty_name;
}

buffer_lease buffer_lease::share() const {
    if (m_detached) {
        buffer_lease copy;
        copy.m_detached = m_detached;
        return copy;
    }
    if (!m_buffer)
        return buffer_lease();
    m_pool->retain(m_slot);
    return buffer_lease(m_pool, m_slot, m_buffer);
}

void buffer_lease::reset() {
    if (m_buffer) {
        m_pool->release(m_slot);
        m_pool = nullptr;
        m_buffer = nullptr;
    }
    m_detached.reset();
}

buffer_pool::buffer_pool(std::size_t capacity, std::size_t buffer_size, buffer_factory factory)
    : m_capacity(capacity), m_buffer_size(buffer_size), m_factory(std::move(factory)),
      m_next_ticket(0), m_now_serving(0), m_cancelled(false), m_in_use(0), m_peak_in_use(0) {
    if (m_capacity == 0)
        throw std::invalid_argument("buffer pool capacity must be at least 1");
    m_slots.reserve(m_capacity);
}

buffer_pool::~buffer_pool() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_in_use != 0) {
        std::cerr << "[Pool] Destroyed with " << m_in_use << " buffer(s) still leased"
                  << std::endl;
    }
    for (auto& slot : m_slots) {
        slot.buffer->close();
        slot.buffer->unlink();
    }
    URLSTREAM_LOG(std::cout << "[Pool] Released " << m_slots.size() << " buffer(s), peak in use "
                            << m_peak_in_use << std::endl);
}

bool buffer_pool::available() const {
    return !m_free.empty() || m_slots.size() < m_capacity;
}

buffer_lease buffer_pool::take_locked() {
    std::size_t slot;
    if (!m_free.empty()) {
        slot = m_free.front();
        m_free.pop_front();
    } else {
        slot = m_slots.size();
        slot_state state;
        state.buffer = m_factory(slot);
        if (!state.buffer || state.buffer->capacity() < m_buffer_size)
            throw std::runtime_error("buffer factory returned an unusable buffer");
        m_slots.push_back(std::move(state));
        URLSTREAM_LOG(std::cout << "[Pool] Created buffer " << slot << " ("
                                << m_slots[slot].buffer->name() << ")" << std::endl);
    }

    slot_state& state = m_slots[slot];
    state.refcount = 1;
    state.owner.reset();
    ++m_in_use;
    if (m_in_use > m_peak_in_use)
        m_peak_in_use = m_in_use;
    return buffer_lease(this, slot, state.buffer.get());
}

buffer_lease buffer_pool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    const std::uint64_t ticket = m_next_ticket++;
    m_cv.wait(lock, [&] { return m_cancelled || (ticket == m_now_serving && available()); });
    if (m_cancelled)
        throw cancelled_error();

    ++m_now_serving;
    // The next ticket holder may be able to proceed as well
    m_cv.notify_all();
    return take_locked();
}

std::optional<buffer_lease> buffer_pool::try_acquire() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled || m_next_ticket != m_now_serving || !available())
        return std::nullopt;
    return take_locked();
}

void buffer_pool::assign(const buffer_lease& lease, std::size_t part_index) {
    if (lease.m_pool != this)
        throw std::invalid_argument("lease does not belong to this pool");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots[lease.m_slot].owner = part_index;
}

std::optional<std::size_t> buffer_pool::owner(std::size_t slot) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return slot < m_slots.size() ? m_slots[slot].owner : std::nullopt;
}

std::size_t buffer_pool::refcount(std::size_t slot) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return slot < m_slots.size() ? m_slots[slot].refcount : 0;
}

void buffer_pool::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool buffer_pool::cancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

void buffer_pool::unlink_all() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& slot : m_slots)
        slot.buffer->unlink();
}

buffer_pool_stats buffer_pool::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    buffer_pool_stats stats;
    stats.capacity = m_capacity;
    stats.created = m_slots.size();
    stats.in_use = m_in_use;
    stats.peak_in_use = m_peak_in_use;
    return stats;
}

void buffer_pool::retain(std::size_t slot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_slots[slot].refcount;
}

void buffer_pool::release(std::size_t slot) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        slot_state& state = m_slots[slot];
        if (state.refcount == 0)
            return;
        if (--state.refcount > 0)
            return;
        state.owner.reset();
        m_free.push_back(slot);
        --m_in_use;
    }
    m_cv.notify_all();
}
