#include "integrity/digest.hpp"

#include <algorithm>
#include <stdexcept>
#include <crc32c/crc32c.h>
#include <openssl/evp.h>

namespace {
constexpr std::uint64_t MiB = 1024ULL * 1024ULL;
constexpr std::size_t max_s3_layouts = 8;
constexpr std::size_t max_s3_parts = 10000;

std::uint64_t ceil_div(std::uint64_t a, std::uint64_t b) {
    return (a + b - 1) / b;
}

// Owns one EVP context for a message digest.
class evp_context {
public:
    explicit evp_context(const EVP_MD* md) : m_md(md), m_ctx(EVP_MD_CTX_new()) {
        if (!m_ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        reset();
    }

    ~evp_context() {
        EVP_MD_CTX_free(m_ctx);
    }

    evp_context(const evp_context&) = delete;
    evp_context& operator=(const evp_context&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(m_ctx, m_md, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    void update(const std::uint8_t* data, std::size_t length) {
        if (length != 0 && EVP_DigestUpdate(m_ctx, data, length) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    std::vector<std::uint8_t> finish() {
        std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
        unsigned int out_length = 0;
        if (EVP_DigestFinal_ex(m_ctx, out.data(), &out_length) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        out.resize(out_length);
        return out;
    }

private:
    const EVP_MD* m_md;
    EVP_MD_CTX* m_ctx;
};

class evp_digest : public digest {
public:
    evp_digest(const EVP_MD* md, bool base64) : m_ctx(md), m_base64(base64) {}

    void update(const std::uint8_t* data, std::size_t length) override {
        m_ctx.update(data, length);
    }

    std::vector<std::string> finish() override {
        auto raw = m_ctx.finish();
        return {m_base64 ? to_base64(raw.data(), raw.size()) : to_hex(raw.data(), raw.size())};
    }

private:
    evp_context m_ctx;
    bool m_base64;
};

class crc32c_digest : public digest {
public:
    crc32c_digest() : m_crc(0) {}

    void update(const std::uint8_t* data, std::size_t length) override {
        m_crc = crc32c::Extend(m_crc, data, length);
    }

    std::vector<std::string> finish() override {
        const std::uint8_t big_endian[] = {
            static_cast<std::uint8_t>(m_crc >> 24), static_cast<std::uint8_t>(m_crc >> 16),
            static_cast<std::uint8_t>(m_crc >> 8), static_cast<std::uint8_t>(m_crc)};
        return {to_base64(big_endian, sizeof(big_endian))};
    }

private:
    std::uint32_t m_crc;
};

// Etag of one candidate part layout.
class s3_etag_layout {
public:
    explicit s3_etag_layout(std::uint64_t part_size)
        : m_part_size(part_size), m_current(EVP_md5()), m_current_size(0) {}

    void update(const std::uint8_t* data, std::size_t length) {
        if (m_part_size == 0) {
            m_current.update(data, length);
            return;
        }
        while (length > 0) {
            std::uint64_t take = std::min<std::uint64_t>(length, m_part_size - m_current_size);
            m_current.update(data, static_cast<std::size_t>(take));
            m_current_size += take;
            data += take;
            length -= static_cast<std::size_t>(take);
            if (m_current_size == m_part_size) {
                close_part();
            }
        }
    }

    std::string finish() {
        if (m_current_size > 0 || m_part_md5s.empty()) {
            close_part();
        }
        if (m_part_md5s.size() == 1) {
            return to_hex(m_part_md5s[0].data(), m_part_md5s[0].size());
        }
        evp_context combined(EVP_md5());
        for (const auto& part : m_part_md5s) {
            combined.update(part.data(), part.size());
        }
        auto raw = combined.finish();
        return to_hex(raw.data(), raw.size()) + "-" + std::to_string(m_part_md5s.size());
    }

private:
    void close_part() {
        m_part_md5s.push_back(m_current.finish());
        m_current.reset();
        m_current_size = 0;
    }

    std::uint64_t m_part_size;
    evp_context m_current;
    std::uint64_t m_current_size;
    std::vector<std::vector<std::uint8_t>> m_part_md5s;
};

class s3_etag_digest : public digest {
public:
    explicit s3_etag_digest(const std::vector<std::uint64_t>& part_sizes) {
        for (auto part_size : part_sizes) {
            m_layouts.push_back(std::make_unique<s3_etag_layout>(part_size));
        }
    }

    void update(const std::uint8_t* data, std::size_t length) override {
        for (auto& layout : m_layouts) {
            layout->update(data, length);
        }
    }

    std::vector<std::string> finish() override {
        std::vector<std::string> etags;
        for (auto& layout : m_layouts) {
            etags.push_back(layout->finish());
        }
        return etags;
    }

private:
    std::vector<std::unique_ptr<s3_etag_layout>> m_layouts;
};

class null_digest : public digest {
public:
    void update(const std::uint8_t*, std::size_t) override {}

    std::vector<std::string> finish() override {
        return {};
    }
};
} // namespace

std::string to_string(digest_algorithm algorithm) {
    switch (algorithm) {
    case digest_algorithm::md5:
        return "md5";
    case digest_algorithm::md5_base64:
        return "md5_base64";
    case digest_algorithm::gs_crc32c:
        return "gs_crc32c";
    case digest_algorithm::sha256:
        return "sha256";
    case digest_algorithm::s3_etag:
        return "s3_etag";
    case digest_algorithm::null:
        return "null";
    }
    return "unknown";
}

std::optional<digest_algorithm> parse_digest_algorithm(const std::string& name) {
    for (auto algorithm : {digest_algorithm::md5, digest_algorithm::md5_base64,
                           digest_algorithm::gs_crc32c, digest_algorithm::sha256,
                           digest_algorithm::s3_etag, digest_algorithm::null}) {
        if (to_string(algorithm) == name)
            return algorithm;
    }
    return std::nullopt;
}

std::unique_ptr<digest> make_digest(const integrity_token& token, std::uint64_t object_size) {
    switch (token.algorithm) {
    case digest_algorithm::md5:
        return std::make_unique<evp_digest>(EVP_md5(), false);
    case digest_algorithm::md5_base64:
        return std::make_unique<evp_digest>(EVP_md5(), true);
    case digest_algorithm::gs_crc32c:
        return std::make_unique<crc32c_digest>();
    case digest_algorithm::sha256:
        return std::make_unique<evp_digest>(EVP_sha256(), false);
    case digest_algorithm::s3_etag: {
        auto layouts = s3_multipart_layouts(object_size, s3_etag_part_count(token.expected));
        if (layouts.empty() || layouts.size() > max_s3_layouts)
            return nullptr;
        return std::make_unique<s3_etag_digest>(layouts);
    }
    case digest_algorithm::null:
        return std::make_unique<null_digest>();
    }
    return nullptr;
}

std::vector<std::uint64_t> s3_multipart_layouts(std::uint64_t object_size,
                                                std::size_t part_count) {
    if (part_count <= 1)
        return {object_size};
    // Whole-MiB parts of at least 1 MiB, and no more than S3 allows
    if (object_size < MiB || part_count > max_s3_parts || part_count > object_size / MiB + 1)
        return {};

    std::uint64_t min_part_size = ceil_div(object_size, part_count * MiB) * MiB;
    std::uint64_t max_part_size = (ceil_div(object_size, (part_count - 1) * MiB) - 1) * MiB;

    std::vector<std::uint64_t> part_sizes;
    for (std::uint64_t size = min_part_size; size <= max_part_size; size += MiB) {
        part_sizes.push_back(size);
        if (part_sizes.size() > max_s3_layouts)
            break;
    }
    return part_sizes;
}

std::size_t s3_etag_part_count(const std::string& etag) {
    auto dash = etag.find('-');
    if (dash == std::string::npos || dash + 1 >= etag.size())
        return 1;
    try {
        return static_cast<std::size_t>(std::stoul(etag.substr(dash + 1)));
    } catch (const std::exception&) {
        return 1;
    }
}

std::string to_hex(const std::uint8_t* data, std::size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string to_base64(const std::uint8_t* data, std::size_t length) {
    // EVP_EncodeBlock also writes a terminating NUL
    std::string out(4 * ((length + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(length));
    out.resize(static_cast<std::size_t>(written));
    return out;
}
