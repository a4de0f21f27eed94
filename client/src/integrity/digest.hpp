#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class digest_algorithm {
    md5,        // hex
    md5_base64, // Content-MD5, x-goog-hash md5
    gs_crc32c,  // x-goog-hash crc32c, base64 of the big-endian value
    sha256,     // hex
    s3_etag,    // md5 of part md5s, "-N" suffixed for multipart uploads
    null,       // accepts anything
};

std::string to_string(digest_algorithm algorithm);
std::optional<digest_algorithm> parse_digest_algorithm(const std::string& name);

struct integrity_token {
    digest_algorithm algorithm;
    std::string expected;
};

class digest {
public:
    virtual ~digest() = default;

    virtual void update(const std::uint8_t* data, std::size_t length) = 0;

    // Finalizes and returns every encoding the object could legitimately have. Most
    // algorithms produce exactly one; s3_etag produces one per plausible part layout.
    virtual std::vector<std::string> finish() = 0;
};

// Returns nullptr when the token cannot be checked for an object of `object_size`
// bytes (an s3 multipart etag with no plausible part layout).
std::unique_ptr<digest> make_digest(const integrity_token& token, std::uint64_t object_size);

// Part sizes an S3 multipart upload of `part_count` parts could have used for an
// object of `object_size` bytes, assuming whole-MiB part sizes.
std::vector<std::uint64_t> s3_multipart_layouts(std::uint64_t object_size,
                                                std::size_t part_count);

// 1 for a plain etag, N for "<hex>-N".
std::size_t s3_etag_part_count(const std::string& etag);

std::string to_hex(const std::uint8_t* data, std::size_t length);
std::string to_base64(const std::uint8_t* data, std::size_t length);
