#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "integrity/digest.hpp"

// Running digest over the ordered byte stream, compared against the expected token
// once the final part has been released.
class integrity_verifier {
public:
    integrity_verifier(const std::optional<integrity_token>& token, std::uint64_t object_size);

    // False when there is nothing to verify against.
    bool active() const {
        return static_cast<bool>(m_digest);
    }

    // Bytes must arrive in ascending offset order, each exactly once.
    void update(const std::uint8_t* data, std::size_t length);

    // Throws integrity_error on mismatch or when fewer than object_size bytes were seen.
    // Later calls are no-ops.
    void finish();

    bool finished() const {
        return m_finished;
    }

    std::uint64_t bytes_digested() const {
        return m_bytes_digested;
    }

private:
    std::optional<integrity_token> m_token;
    std::unique_ptr<digest> m_digest;
    std::uint64_t m_object_size;
    std::uint64_t m_bytes_digested;
    bool m_finished;
};
