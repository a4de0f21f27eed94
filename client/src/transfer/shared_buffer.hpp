#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// A fixed-size memory region that other processes can map by name.
class shared_buffer {
public:
    virtual ~shared_buffer() = default;

    virtual const std::string& name() const = 0;
    virtual std::size_t capacity() const = 0;
    virtual std::uint8_t* data() = 0;
    virtual const std::uint8_t* data() const = 0;

    // Unmaps the region. The name stays valid until unlink().
    virtual void close() = 0;

    // Removes the name. Existing mappings remain usable.
    virtual void unlink() = 0;
};

// POSIX shm_open + mmap. Names look like "/urlstream-<pid>-<n>".
class posix_shared_buffer : public shared_buffer {
public:
    ~posix_shared_buffer() override;

    posix_shared_buffer(const posix_shared_buffer&) = delete;
    posix_shared_buffer& operator=(const posix_shared_buffer&) = delete;

    // Both throw std::system_error.
    static std::unique_ptr<posix_shared_buffer> create(const std::string& name,
                                                       std::size_t capacity);
    static std::unique_ptr<posix_shared_buffer> open(const std::string& name);

    // Removes a name without a mapped instance. Returns false if it did not exist.
    static bool unlink(const std::string& name);

    const std::string& name() const override {
        return m_name;
    }

    std::size_t capacity() const override {
        return m_capacity;
    }

    std::uint8_t* data() override {
        return m_data;
    }

    const std::uint8_t* data() const override {
        return m_data;
    }

    void close() override;
    void unlink() override;

private:
    posix_shared_buffer(std::string name, std::uint8_t* data, std::size_t capacity, bool owner);

    std::string m_name;
    std::uint8_t* m_data;
    std::size_t m_capacity;
    bool m_owner;
    bool m_unlinked;
};

// Creates the buffer for a given pool slot.
using buffer_factory = std::function<std::unique_ptr<shared_buffer>(std::size_t slot)>;

// Factory producing posix_shared_buffers named "<prefix>-<slot>".
buffer_factory posix_buffer_factory(const std::string& prefix, std::size_t capacity);
