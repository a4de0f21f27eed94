#include "url_stream.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

#include "log.hpp"
#include "net/curl_transport.hpp"
#include "transfer/chunk_planner.hpp"
#include "transfer/fetch_scheduler.hpp"
#include "transfer/sequential_source.hpp"

namespace {
std::atomic<unsigned> session_counter(0);

std::string buffer_prefix() {
    return "/urlstream-" + std::to_string(getpid()) + "-" + std::to_string(++session_counter);
}
} // namespace

std::unique_ptr<url_stream> url_stream::open(const std::string& url, const session_config& config,
                                             transport_factory factory,
                                             const stream_options& options) {
    config.validate();
    if (!factory)
        factory = curl_transport::factory(config);

    auto transport = factory();
    size_probe probe(*transport, config);
    remote_object object = probe.run(url);

    std::unique_ptr<url_stream> stream(new url_stream(std::move(object), config, options));
    stream->start(std::move(transport), std::move(factory), options.checksum);
    return stream;
}

url_stream::url_stream(remote_object object, const session_config& config,
                       const stream_options& options)
    : m_object(std::move(object)), m_config(config), m_order(options.order),
      m_in_part_offset(0), m_delivered(0), m_closed(false), m_finished(false),
      m_torn_down(false), m_source_stopped(false) {}

url_stream::~url_stream() {
    close();
}

void url_stream::start(std::unique_ptr<transport> transport, transport_factory factory,
                       const std::optional<integrity_token>& checksum) {
    m_parts = std::make_unique<part_table>(plan_parts(m_object.size, m_config.chunk_size));
    m_assembler = std::make_unique<assembler>(m_parts->size(), m_order);

    if (m_order == delivery_order::ordered) {
        auto token = checksum ? checksum : m_object.token;
        if (!token) {
            std::cerr << "[Stream] No checksum available for " << m_object.name
                      << "; delivering unverified" << std::endl;
        }
        m_verifier = std::make_unique<integrity_verifier>(token, m_object.size);
    }

    if (m_parts->size() == 0) {
        URLSTREAM_LOG(std::cout << "[Stream] Empty object, nothing to fetch" << std::endl);
        return;
    }

    if (m_config.concurrency_enabled() && m_object.range_supported) {
        const std::size_t buffer_size = static_cast<std::size_t>(m_config.chunk_size);
        m_pool = std::make_unique<buffer_pool>(m_config.effective_pool_size(), buffer_size,
                                               posix_buffer_factory(buffer_prefix(), buffer_size));
        auto scheduler = std::make_unique<fetch_scheduler>(m_object.url, m_config, *m_parts,
                                                           *m_pool, std::move(factory));
        scheduler->start();
        m_source = std::move(scheduler);
    } else {
        if (m_config.concurrency_enabled()) {
            std::cerr << "[Stream] Server does not support range requests; fetching "
                      << m_object.name << " sequentially" << std::endl;
        }
        m_source = std::make_unique<sequential_source>(transport->open_body(m_object.url),
                                                       *m_parts);
    }

    URLSTREAM_LOG(std::cout << "[Stream] " << m_object.name << ": " << m_parts->size()
                            << " part(s), " << (m_pool ? "concurrent" : "sequential")
                            << std::endl);
}

std::size_t url_stream::read(std::uint8_t* dest, std::size_t n) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_failure)
        std::rethrow_exception(m_failure);
    if (m_closed)
        return 0;
    if (m_order != delivery_order::ordered)
        throw std::logic_error("read() needs ordered delivery; use next_chunk()");

    std::size_t copied = 0;
    while (copied < n) {
        // The end-of-stream verdict waits for a call that has nothing left to return
        if (!advance(copied == 0))
            break;

        std::size_t take = std::min(n - copied, m_current->length - m_in_part_offset);
        std::memcpy(dest + copied, m_current->data() + m_in_part_offset, take);
        m_in_part_offset += take;
        copied += take;
        m_delivered += take;

        if (m_in_part_offset == m_current->length)
            release_current();
    }
    return copied;
}

std::vector<std::uint8_t> url_stream::read(std::size_t n) {
    std::vector<std::uint8_t> bytes(n);
    bytes.resize(read(bytes.data(), n));
    return bytes;
}

std::optional<stream_chunk> url_stream::next_chunk() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_failure)
        std::rethrow_exception(m_failure);
    if (m_closed || !advance(true))
        return std::nullopt;

    stream_chunk chunk;
    chunk.index = m_current->index;
    chunk.offset = m_current->offset + m_in_part_offset;
    chunk.length = m_current->length - m_in_part_offset;
    chunk.start = m_in_part_offset;
    chunk.buffer = std::move(m_current->buffer);
    m_delivered += chunk.length;
    release_current();
    return chunk;
}

bool url_stream::advance(bool may_finish) {
    if (m_current && m_in_part_offset < m_current->length)
        return true;
    release_current();
    if (m_finished)
        return false;

    auto next = pull_next();
    if (!next) {
        if (!m_closed && may_finish)
            finish_stream();
        return false;
    }
    m_current = std::move(next);
    m_in_part_offset = 0;
    return true;
}

std::optional<completion_record> url_stream::pull_next() {
    for (;;) {
        if (auto ready = m_assembler->next_ready()) {
            if (m_verifier)
                m_verifier->update(ready->data(), ready->length);
            return ready;
        }
        if (m_assembler->exhausted() || !m_source || m_torn_down)
            return std::nullopt;

        auto record = m_source->next_completion();
        if (!record) {
            if (m_closed)
                return std::nullopt;
            throw fail(completion_record());
        }
        if (record->failed)
            throw fail(*record);
        m_assembler->accept(std::move(*record));
    }
}

fetch_error url_stream::fail(const completion_record& record) {
    std::string message;
    if (record.failed && record.index == fetch_error::no_part) {
        message = "transfer failed: " + record.error;
    } else if (record.failed) {
        message = "part " + std::to_string(record.index) + " (bytes " +
                  std::to_string(record.offset) + "-" +
                  std::to_string(record.offset + record.length - 1) + ") failed after " +
                  std::to_string(record.attempts) + " attempt(s): " + record.error;
    } else {
        message = "workers stopped before part " +
                  std::to_string(m_assembler->next_required_index()) + " was delivered";
    }

    fetch_error error(message, record.failed ? record.index : fetch_error::no_part,
                      record.http_status);
    m_failure = std::make_exception_ptr(error);
    teardown(true);
    return error;
}

void url_stream::finish_stream() {
    m_finished = true;
    teardown(false);

    URLSTREAM_LOG(std::cout << "[Stream] Delivered " << m_delivered << " of " << m_object.size
                            << " bytes" << std::endl);
    if (m_verifier)
        m_verifier->finish();
}

void url_stream::close() {
    if (m_closed.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lock(m_source_mutex);
        if (m_source && !m_source_stopped)
            m_source->cancel();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    teardown(true);
}

void url_stream::teardown(bool cancel) {
    if (m_torn_down)
        return;
    m_torn_down = true;

    {
        std::lock_guard<std::mutex> lock(m_source_mutex);
        m_source_stopped = true;
    }

    if (m_source) {
        if (cancel)
            m_source->cancel();
        m_source->shutdown();
        // Results that were never consumed give their buffers back here
        while (m_source->next_completion()) {
        }
    }

    release_current();
    if (m_assembler)
        m_assembler->clear();
    if (m_pool)
        m_pool->unlink_all();

    URLSTREAM_LOG(std::cout << "[Stream] Session for " << m_object.name << " torn down"
                            << std::endl);
}

void url_stream::release_current() {
    if (!m_current)
        return;
    m_parts->set_state(m_current->index, part_state::released);
    m_current.reset();
    m_in_part_offset = 0;
}

std::vector<part> url_stream::parts() const {
    return m_parts ? m_parts->snapshot() : std::vector<part>();
}

stream_stats url_stream::stats() const {
    stream_stats stats;
    if (m_pool)
        stats.pool = m_pool->stats();
    stats.bytes_delivered = m_delivered;
    stats.parts_total = m_parts ? m_parts->size() : 0;
    stats.concurrent = static_cast<bool>(m_pool);
    return stats;
}

chunk_range::chunk_range(std::unique_ptr<url_stream> stream)
    : m_stream(std::move(stream)), m_started(false) {}

chunk_range::iterator chunk_range::begin() {
    if (m_started)
        throw std::logic_error("chunk_range can only be iterated once");
    m_started = true;
    return advance() ? iterator(this) : iterator();
}

bool chunk_range::advance() {
    // The previous chunk goes back to the pool before the next one is requested
    m_current.reset();
    m_current = m_stream->next_chunk();
    return m_current.has_value();
}

chunk_range iterate(const std::string& url, const session_config& config,
                    transport_factory factory) {
    return chunk_range(url_stream::open(url, config, std::move(factory)));
}

chunk_range iterate_unordered(const std::string& url, const session_config& config,
                              transport_factory factory) {
    stream_options options;
    options.order = delivery_order::unordered;
    return chunk_range(url_stream::open(url, config, std::move(factory), options));
}
