#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "ipc.hpp"
#include "net/transport.hpp"
#include "session_config.hpp"
#include "transfer/buffer_pool.hpp"
#include "transfer/channel.hpp"
#include "transfer/part_source.hpp"
#include "transfer/part_table.hpp"

// Concurrent range fetching through forked worker processes. Each worker is driven by
// an agent thread in this process that owns the buffer, the part claim and the retry
// state; the worker only sees buffer names.
class fetch_scheduler : public part_source {
public:
    fetch_scheduler(std::string url, const session_config& config, part_table& parts,
                    buffer_pool& pool, transport_factory factory);
    ~fetch_scheduler() override;

    fetch_scheduler(const fetch_scheduler&) = delete;
    fetch_scheduler& operator=(const fetch_scheduler&) = delete;

    // Forks the workers, then starts the agents. Must run while this process has no
    // other thread of its own, including the agents of another scheduler. Throws
    // fetch_error.
    void start();

    std::optional<completion_record> next_completion() override;
    void cancel() override;
    void shutdown() override;

private:
    struct worker_handle {
        pid_t pid = -1;
        ipc channel;
        std::thread agent;
    };

    void agent_loop(worker_handle& handle);
    // index is fetch_error::no_part for failures that belong to no part.
    void publish_failure(std::size_t index, unsigned attempts, const std::string& message,
                         int http_status);
    // False when cancelled during the wait.
    bool wait_backoff(std::chrono::milliseconds delay);
    void stop_workers();

    std::string m_url;
    session_config m_config;
    part_table& m_parts;
    buffer_pool& m_pool;
    transport_factory m_factory;

    std::vector<std::unique_ptr<worker_handle>> m_workers;
    channel<completion_record> m_completions;
    std::atomic<std::size_t> m_running_agents;
    std::atomic<bool> m_cancelled;
    std::atomic<bool> m_failed;

    std::mutex m_state_mutex;
    std::condition_variable m_cancel_cv;
    bool m_shut_down;
};
