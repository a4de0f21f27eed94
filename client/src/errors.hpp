#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

class urlstream_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Size or range capability of the remote object could not be determined.
class probe_error : public urlstream_error {
public:
    using urlstream_error::urlstream_error;
};

// A part exhausted its retry budget or hit a non-retryable status.
class fetch_error : public urlstream_error {
public:
    static constexpr std::size_t no_part = static_cast<std::size_t>(-1);

    fetch_error(const std::string& message, std::size_t part_index = no_part, int http_status = 0)
        : urlstream_error(message), m_part_index(part_index), m_http_status(http_status) {}

    std::size_t part_index() const {
        return m_part_index;
    }

    int http_status() const {
        return m_http_status;
    }

private:
    std::size_t m_part_index;
    int m_http_status;
};

// Raised after every byte was delivered, when the digest disagrees with the token.
class integrity_error : public urlstream_error {
public:
    integrity_error(const std::string& algorithm, const std::string& expected,
                    const std::string& actual)
        : urlstream_error("checksum mismatch (" + algorithm + "): expected " + expected + ", got " +
                          actual),
          m_expected(expected), m_actual(actual) {}

    const std::string& expected() const {
        return m_expected;
    }

    const std::string& actual() const {
        return m_actual;
    }

private:
    std::string m_expected;
    std::string m_actual;
};

class config_error : public urlstream_error {
public:
    using urlstream_error::urlstream_error;
};

// Normal termination signal after a caller-initiated close.
class cancelled_error : public urlstream_error {
public:
    cancelled_error() : urlstream_error("cancelled") {}
};
