#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transfer/shared_buffer.hpp"

class buffer_pool;

// Move-only reference to one pool buffer. Releases on destruction. A detached lease
// owns process-local memory instead and never touches a pool.
class buffer_lease {
public:
    buffer_lease();
    ~buffer_lease();

    buffer_lease(const buffer_lease&) = delete;
    buffer_lease& operator=(const buffer_lease&) = delete;

    buffer_lease(buffer_lease&& other) noexcept;
    buffer_lease& operator=(buffer_lease&& other) noexcept;

    static buffer_lease detached(std::vector<std::uint8_t> bytes);

    bool valid() const;
    explicit operator bool() const {
        return valid();
    }

    std::uint8_t* data();
    const std::uint8_t* data() const;
    std::size_t capacity() const;

    // Shared buffer name; empty for a detached lease.
    const std::string& name() const;
    std::size_t slot() const {
        return m_slot;
    }

    // Another reference to the same buffer (refcount + 1).
    buffer_lease share() const;

    // Drops this reference early.
    void reset();

private:
    friend class buffer_pool;
    buffer_lease(buffer_pool* pool, std::size_t slot, shared_buffer* buffer);

    buffer_pool* m_pool;
    std::size_t m_slot;
    shared_buffer* m_buffer;
    std::shared_ptr<std::vector<std::uint8_t>> m_detached;
};

struct buffer_pool_stats {
    std::size_t capacity = 0;
    std::size_t created = 0;
    std::size_t in_use = 0;
    std::size_t peak_in_use = 0;
};

// Bounded set of reusable buffers of one fixed size. Buffers are created on demand
// up to `capacity` and handed out to waiters in arrival order.
class buffer_pool {
public:
    buffer_pool(std::size_t capacity, std::size_t buffer_size, buffer_factory factory);
    ~buffer_pool();

    buffer_pool(const buffer_pool&) = delete;
    buffer_pool& operator=(const buffer_pool&) = delete;

    // Blocks until a buffer is free. Throws cancelled_error once cancel() was called.
    buffer_lease acquire();

    // Non-blocking variant; empty when nothing is free or the pool was cancelled.
    std::optional<buffer_lease> try_acquire();

    // Records which part a leased buffer now holds.
    void assign(const buffer_lease& lease, std::size_t part_index);
    std::optional<std::size_t> owner(std::size_t slot) const;
    std::size_t refcount(std::size_t slot) const;

    // Wakes every waiter with cancelled_error. Outstanding leases stay valid.
    void cancel();
    bool cancelled() const;

    // Removes the names of every buffer created so far. Mappings stay valid until the
    // pool is destroyed.
    void unlink_all();

    std::size_t capacity() const {
        return m_capacity;
    }

    std::size_t buffer_size() const {
        return m_buffer_size;
    }

    buffer_pool_stats stats() const;

private:
    friend class buffer_lease;

    struct slot_state {
        std::unique_ptr<shared_buffer> buffer;
        std::size_t refcount = 0;
        std::optional<std::size_t> owner;
    };

    void retain(std::size_t slot);
    void release(std::size_t slot);
    bool available() const;
    buffer_lease take_locked();

    const std::size_t m_capacity;
    const std::size_t m_buffer_size;
    buffer_factory m_factory;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<slot_state> m_slots;
    std::deque<std::size_t> m_free;
    std::uint64_t m_next_ticket;
    std::uint64_t m_now_serving;
    bool m_cancelled;
    std::size_t m_in_use;
    std::size_t m_peak_in_use;
};
