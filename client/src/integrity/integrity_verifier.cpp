#include "integrity/integrity_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "errors.hpp"
#include "log.hpp"

namespace {
std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}
} // namespace

integrity_verifier::integrity_verifier(const std::optional<integrity_token>& token,
                                       std::uint64_t object_size)
    : m_token(token), m_object_size(object_size), m_bytes_digested(0), m_finished(false) {
    if (!m_token) {
        return;
    }
    m_digest = make_digest(*m_token, object_size);
    if (!m_digest) {
        std::cerr << "[Integrity] Cannot verify " << to_string(m_token->algorithm) << " value "
                  << m_token->expected << " for a " << object_size
                  << " byte object; delivering unverified" << std::endl;
    }
}

void integrity_verifier::update(const std::uint8_t* data, std::size_t length) {
    if (!m_digest || m_finished)
        return;
    m_digest->update(data, length);
    m_bytes_digested += length;
}

void integrity_verifier::finish() {
    if (!m_digest || m_finished)
        return;
    m_finished = true;

    const std::string algorithm = to_string(m_token->algorithm);
    if (m_bytes_digested != m_object_size) {
        throw integrity_error(algorithm, std::to_string(m_object_size) + " bytes",
                              std::to_string(m_bytes_digested) + " bytes");
    }
    if (m_token->algorithm == digest_algorithm::null)
        return;

    // Hex encodings are case-insensitive; base64 is not
    bool hex = m_token->algorithm != digest_algorithm::md5_base64 &&
               m_token->algorithm != digest_algorithm::gs_crc32c;
    const std::string expected = hex ? to_lower_copy(m_token->expected) : m_token->expected;

    auto candidates = m_digest->finish();
    for (const auto& candidate : candidates) {
        if (candidate == expected) {
            URLSTREAM_LOG(std::cout << "[Integrity] " << algorithm << " verified: " << candidate
                                    << std::endl);
            return;
        }
    }
    throw integrity_error(algorithm, m_token->expected,
                          candidates.empty() ? std::string("<none>") : candidates.front());
}
