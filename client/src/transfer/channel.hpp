#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Unbounded multi-producer queue that can be closed. Values queued before close()
// are still delivered.
template <typename T>
class channel {
public:
    channel() : m_closed(false) {}

    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    // Returns false, dropping the value, once the channel is closed.
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed)
                return false;
            m_queue.push_back(std::move(value));
        }
        m_cv.notify_one();
        return true;
    }

    // Blocks until a value is available. Empty once closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_closed || !m_queue.empty(); });
        if (m_queue.empty())
            return std::nullopt;
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_queue;
    bool m_closed;
};
