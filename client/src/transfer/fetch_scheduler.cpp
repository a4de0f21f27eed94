#include "transfer/fetch_scheduler.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "errors.hpp"
#include "log.hpp"
#include "transfer/fetch_protocol.hpp"
#include "util/defer.hpp"
#include "worker.hpp"

fetch_scheduler::fetch_scheduler(std::string url, const session_config& config,
                                 part_table& parts, buffer_pool& pool, transport_factory factory)
    : m_url(std::move(url)), m_config(config), m_parts(parts), m_pool(pool),
      m_factory(std::move(factory)), m_running_agents(0), m_cancelled(false), m_failed(false),
      m_shut_down(false) {}

fetch_scheduler::~fetch_scheduler() {
    cancel();
    shutdown();
}

void fetch_scheduler::start() {
    const std::size_t count = std::min(m_config.concurrency, m_parts.size());
    std::vector<int> controller_fds;

    for (std::size_t i = 0; i < count; ++i) {
        auto pair = ipc::create_pair();
        if (!pair) {
            stop_workers();
            throw fetch_error("failed to create a channel for worker " + std::to_string(i));
        }

        std::cout.flush();
        pid_t pid = fork();
        if (pid == -1) {
            int err = errno;
            stop_workers();
            throw fetch_error("failed to spawn worker " + std::to_string(i) + ": " +
                              strerror(err));
        }

        if (pid == 0) {
            // Child: keep only our own end of our own channel, never unwind into the
            // controller's stack.
            for (int fd : controller_fds)
                close(fd);
            pair->first.close_socket();
            int code = 1;
            try {
                worker w(std::move(pair->second), m_url, m_factory);
                code = w.run();
            } catch (const std::exception& e) {
                std::cerr << "[Worker] " << e.what() << std::endl;
            }
            _exit(code);
        }

        auto handle = std::make_unique<worker_handle>();
        handle->pid = pid;
        handle->channel = std::move(pair->first);
        pair->second.close_socket();
        controller_fds.push_back(handle->channel.get_socket_fd());
        m_workers.push_back(std::move(handle));

        URLSTREAM_LOG(std::cout << "[Scheduler] Spawned worker " << i << " (pid " << pid << ")"
                                << std::endl);
    }

    m_running_agents = m_workers.size();
    if (m_workers.empty()) {
        m_completions.close();
        return;
    }
    for (auto& handle : m_workers)
        handle->agent = std::thread(&fetch_scheduler::agent_loop, this, std::ref(*handle));
}

void fetch_scheduler::agent_loop(worker_handle& handle) {
    // The last agent out ends the completion stream
    DEFER(if (--m_running_agents == 0) m_completions.close(););

    while (!m_cancelled && !m_failed) {
        // Buffer first, then the claim: claims stay in ascending order among holders
        buffer_lease lease;
        try {
            lease = m_pool.acquire();
        } catch (const cancelled_error&) {
            return;
        } catch (const std::exception& e) {
            // No part is claimed yet; the whole session fails
            publish_failure(fetch_error::no_part, 0,
                            std::string("cannot obtain a transfer buffer: ") + e.what(), 0);
            return;
        }

        if (m_failed)
            return;
        auto claimed = m_parts.claim();
        if (!claimed)
            return;
        const std::size_t index = *claimed;
        const part& planned = m_parts.plan(index);
        m_pool.assign(lease, index);

        unsigned attempt = m_parts.attempts(index);
        for (;;) {
            fetch_request request;
            request.part_index = index;
            request.offset = planned.offset;
            request.length = planned.length;
            request.attempt = attempt;
            request.buffer_name = lease.name();

            std::optional<fetch_result> result;
            if (handle.channel.send_fetch_request(request))
                result = handle.channel.receive_fetch_result();
            if (m_cancelled)
                return;
            if (!result) {
                m_parts.set_state(index, part_state::failed);
                publish_failure(index, attempt,
                                "worker process " + std::to_string(handle.pid) +
                                    " stopped responding",
                                0);
                return;
            }

            if (result->status == fetch_status::completed) {
                m_parts.set_state(index, part_state::ready);
                completion_record record;
                record.index = index;
                record.offset = planned.offset;
                record.length = planned.length;
                record.buffer = std::move(lease);
                record.attempts = attempt;
                record.http_status = result->http_status;
                m_completions.push(std::move(record));
                break;
            }

            if (result->status == fetch_status::transient_error &&
                attempt <= m_config.max_retries) {
                auto delay = retry_delay(attempt, m_config);
                URLSTREAM_LOG(std::cout << "[Scheduler] Part " << index << " attempt " << attempt
                                        << " failed (" << result->message << "), retrying in "
                                        << delay.count() << " ms" << std::endl);
                m_parts.set_state(index, part_state::pending);
                if (!wait_backoff(delay))
                    return;
                attempt = m_parts.begin_attempt(index);
                continue;
            }

            m_parts.set_state(index, part_state::failed);
            std::string message = result->message;
            if (result->status == fetch_status::transient_error)
                message += " (gave up after " + std::to_string(attempt) + " attempts)";
            publish_failure(index, attempt, message, result->http_status);
            return;
        }
    }
}

void fetch_scheduler::publish_failure(std::size_t index, unsigned attempts,
                                      const std::string& message, int http_status) {
    m_failed = true;

    completion_record record;
    record.index = index;
    if (index == fetch_error::no_part) {
        std::cerr << "[Scheduler] Session failed: " << message << std::endl;
    } else {
        std::cerr << "[Scheduler] Part " << index << " failed: " << message << std::endl;
        record.offset = m_parts.plan(index).offset;
        record.length = m_parts.plan(index).length;
    }
    record.attempts = attempts;
    record.failed = true;
    record.error = message;
    record.http_status = http_status;
    m_completions.push(std::move(record));
}

bool fetch_scheduler::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_state_mutex);
    return !m_cancel_cv.wait_for(lock, delay, [this] { return m_cancelled.load(); });
}

std::optional<completion_record> fetch_scheduler::next_completion() {
    return m_completions.pop();
}

void fetch_scheduler::cancel() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_shut_down || m_cancelled)
        return;
    m_cancelled = true;
    m_cancel_cv.notify_all();

    URLSTREAM_LOG(std::cout << "[Scheduler] Cancelling " << m_workers.size() << " worker(s)"
                            << std::endl);
    m_pool.cancel();
    // In-flight requests are left to finish; their results are never read
    for (auto& handle : m_workers)
        handle->channel.shutdown();
}

void fetch_scheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_shut_down)
            return;
    }

    // Every part has been claimed or the session is over; agents parked in acquire()
    // have nothing left to do.
    m_pool.cancel();
    for (auto& handle : m_workers) {
        if (handle->agent.joinable())
            handle->agent.join();
    }
    stop_workers();

    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_shut_down = true;
}

void fetch_scheduler::stop_workers() {
    for (auto& handle : m_workers) {
        if (handle->pid <= 0)
            continue;

        if (m_cancelled || !handle->channel.send_stop())
            kill(handle->pid, SIGTERM);

        int status = 0;
        while (waitpid(handle->pid, &status, 0) == -1 && errno == EINTR) {
        }
        URLSTREAM_LOG(std::cout << "[Scheduler] Worker " << handle->pid << " exited" << std::endl);

        handle->channel.close_socket();
        handle->pid = -1;
    }
}
