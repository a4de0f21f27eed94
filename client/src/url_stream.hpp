#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "integrity/integrity_verifier.hpp"
#include "net/size_probe.hpp"
#include "net/transport.hpp"
#include "session_config.hpp"
#include "transfer/assembler.hpp"
#include "transfer/buffer_pool.hpp"
#include "transfer/part_source.hpp"
#include "transfer/part_table.hpp"

// One part, or what is left of it, handed to the caller together with its buffer.
// The buffer goes back to the pool when the chunk is destroyed or released; chunks
// must not outlive their stream.
struct stream_chunk {
    std::size_t index = 0;
    std::uint64_t offset = 0; // object offset of data()[0]
    std::size_t length = 0;
    buffer_lease buffer;
    std::size_t start = 0; // position of data()[0] inside the buffer

    const std::uint8_t* data() const {
        return buffer.data() + start;
    }

    void release() {
        buffer.reset();
    }
};

struct stream_options {
    delivery_order order = delivery_order::ordered;
    std::optional<integrity_token> checksum; // replaces whatever the probe found
};

struct stream_stats {
    buffer_pool_stats pool;
    std::uint64_t bytes_delivered = 0;
    std::size_t parts_total = 0;
    bool concurrent = false;
};

// Read cursor over a remote object fetched in concurrent ranges. Bytes come out in
// offset order and are checked against the object's checksum when the end is reached.
class url_stream {
public:
    // Probes the object and starts fetching. Throws config_error, probe_error or
    // fetch_error. An empty factory means libcurl.
    //
    // Concurrent streams fork their workers here, so call this while the process runs
    // no other thread: no open concurrent stream, no caller threads. Close the previous
    // stream before opening the next.
    static std::unique_ptr<url_stream> open(const std::string& url,
                                            const session_config& config = session_config(),
                                            transport_factory factory = nullptr,
                                            const stream_options& options = stream_options());

    ~url_stream();

    url_stream(const url_stream&) = delete;
    url_stream& operator=(const url_stream&) = delete;

    // Copies up to n bytes. Returns 0 at the end of the stream or after close().
    // The call that reaches the end throws integrity_error on a checksum mismatch;
    // any failed part throws fetch_error.
    std::size_t read(std::uint8_t* dest, std::size_t n);
    std::vector<std::uint8_t> read(std::size_t n);

    // The next part as a whole, without copying.
    std::optional<stream_chunk> next_chunk();

    // Stops every worker and releases every buffer. Safe to call from another thread
    // while read() blocks; that read then returns what it has.
    void close();
    bool closed() const {
        return m_closed;
    }

    std::uint64_t tell() const {
        return m_delivered;
    }

    std::uint64_t size() const {
        return m_object.size;
    }

    const remote_object& object() const {
        return m_object;
    }

    // Whether the delivered bytes are being checked against a checksum.
    bool verifying() const {
        return m_verifier && m_verifier->active();
    }

    std::vector<part> parts() const;
    stream_stats stats() const;

private:
    url_stream(remote_object object, const session_config& config, const stream_options& options);

    void start(std::unique_ptr<transport> transport, transport_factory factory,
               const std::optional<integrity_token>& checksum);
    bool advance(bool may_finish);
    std::optional<completion_record> pull_next();
    fetch_error fail(const completion_record& record);
    void finish_stream();
    void teardown(bool cancel);
    void release_current();

    remote_object m_object;
    session_config m_config;
    delivery_order m_order;

    // Declared first so it outlives every lease below
    std::unique_ptr<buffer_pool> m_pool;
    std::unique_ptr<part_table> m_parts;
    std::unique_ptr<part_source> m_source;
    std::unique_ptr<assembler> m_assembler;
    std::unique_ptr<integrity_verifier> m_verifier;
    std::optional<completion_record> m_current;
    std::size_t m_in_part_offset;

    std::atomic<std::uint64_t> m_delivered;
    std::atomic<bool> m_closed;
    bool m_finished;
    bool m_torn_down;
    std::exception_ptr m_failure;

    std::mutex m_mutex;        // cursor, assembler and teardown
    std::mutex m_source_mutex; // cancel() from close() vs teardown
    bool m_source_stopped;
};

// Single-pass sequence of chunks for range-for. Each chunk is released when the loop
// moves on to the next one.
class chunk_range {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = stream_chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const stream_chunk*;
        using reference = const stream_chunk&;

        iterator() : m_range(nullptr) {}

        reference operator*() const {
            return *m_range->m_current;
        }

        pointer operator->() const {
            return &*m_range->m_current;
        }

        iterator& operator++() {
            if (!m_range->advance())
                m_range = nullptr;
            return *this;
        }

        bool operator==(const iterator& other) const {
            return m_range == other.m_range;
        }

        bool operator!=(const iterator& other) const {
            return m_range != other.m_range;
        }

    private:
        friend class chunk_range;
        explicit iterator(chunk_range* range) : m_range(range) {}

        chunk_range* m_range;
    };

    explicit chunk_range(std::unique_ptr<url_stream> stream);

    chunk_range(chunk_range&&) = default;
    chunk_range& operator=(chunk_range&&) = default;

    // Throws std::logic_error when called a second time.
    iterator begin();
    iterator end() {
        return iterator();
    }

    url_stream& stream() {
        return *m_stream;
    }

private:
    bool advance();

    std::unique_ptr<url_stream> m_stream;
    std::optional<stream_chunk> m_current;
    bool m_started;
};

// Whole parts in offset order, verified at the end. Forks like url_stream::open and
// has the same single-thread restriction.
chunk_range iterate(const std::string& url, const session_config& config = session_config(),
                    transport_factory factory = nullptr);

// Whole parts in completion order, each tagged with its offset. Not verified. Same
// single-thread restriction as url_stream::open.
chunk_range iterate_unordered(const std::string& url,
                              const session_config& config = session_config(),
                              transport_factory factory = nullptr);
