#include "transfer/shared_buffer.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "log.hpp"

posix_shared_buffer::posix_shared_buffer(std::string name, std::uint8_t* data,
                                         std::size_t capacity, bool owner)
    : m_name(std::move(name)), m_data(data), m_capacity(capacity), m_owner(owner),
      m_unlinked(false) {}

posix_shared_buffer::~posix_shared_buffer() {
    close();
    if (m_owner)
        unlink();
}

std::unique_ptr<posix_shared_buffer> posix_shared_buffer::create(const std::string& name,
                                                                 std::size_t capacity) {
    int fd = shm_open(name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0600);
    if (fd == -1)
        throw std::system_error(errno, std::generic_category(), "shm_open " + name);

    if (ftruncate(fd, static_cast<off_t>(capacity)) == -1) {
        int err = errno;
        ::close(fd);
        shm_unlink(name.c_str());
        throw std::system_error(err, std::generic_category(), "ftruncate " + name);
    }

    void* addr = nullptr;
    if (capacity > 0) {
        addr = mmap(nullptr, capacity, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
        if (addr == MAP_FAILED) {
            int err = errno;
            ::close(fd);
            shm_unlink(name.c_str());
            throw std::system_error(err, std::generic_category(), "mmap " + name);
        }
    }
    // The mapping keeps the object alive
    ::close(fd);

    URLSTREAM_LOG(std::cout << "[SharedBuffer] Created " << name << " (" << capacity
                            << " bytes)" << std::endl);
    return std::unique_ptr<posix_shared_buffer>(
        new posix_shared_buffer(name, static_cast<std::uint8_t*>(addr), capacity, true));
}

std::unique_ptr<posix_shared_buffer> posix_shared_buffer::open(const std::string& name) {
    int fd = shm_open(name.c_str(), O_RDWR, 0);
    if (fd == -1)
        throw std::system_error(errno, std::generic_category(), "shm_open " + name);

    struct stat st;
    if (fstat(fd, &st) == -1) {
        int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "fstat " + name);
    }

    std::size_t capacity = static_cast<std::size_t>(st.st_size);
    void* addr = nullptr;
    if (capacity > 0) {
        addr = mmap(nullptr, capacity, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
        if (addr == MAP_FAILED) {
            int err = errno;
            ::close(fd);
            throw std::system_error(err, std::generic_category(), "mmap " + name);
        }
    }
    ::close(fd);

    return std::unique_ptr<posix_shared_buffer>(
        new posix_shared_buffer(name, static_cast<std::uint8_t*>(addr), capacity, false));
}

bool posix_shared_buffer::unlink(const std::string& name) {
    return shm_unlink(name.c_str()) == 0;
}

void posix_shared_buffer::close() {
    if (m_data != nullptr) {
        munmap(m_data, m_capacity);
        m_data = nullptr;
    }
}

void posix_shared_buffer::unlink() {
    if (m_unlinked)
        return;
    m_unlinked = true;
    if (shm_unlink(m_name.c_str()) == -1 && errno != ENOENT) {
        std::cerr << "[SharedBuffer] Failed to unlink " << m_name << ": " << strerror(errno)
                  << std::endl;
    }
}

buffer_factory posix_buffer_factory(const std::string& prefix, std::size_t capacity) {
    return [prefix, capacity](std::size_t slot) -> std::unique_ptr<shared_buffer> {
        return posix_shared_buffer::create(prefix + "-" + std::to_string(slot), capacity);
    };
}
