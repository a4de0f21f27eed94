#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "integrity/digest.hpp"
#include "net/http.hpp"
#include "net/transport.hpp"
#include "session_config.hpp"

struct remote_object {
    std::string url;
    std::uint64_t size = 0;
    bool range_supported = false;
    std::optional<integrity_token> token;
    std::map<std::string, std::string> checksums; // gs_md5, gs_crc32c, md5_base64, s3_etag, etag
    std::string name;
};

class size_probe {
public:
    size_probe(transport& transport, const session_config& config);

    // Throws probe_error.
    remote_object run(const std::string& url);

    // Checksums advertised by the response headers, keyed by their origin.
    static std::map<std::string, std::string>
    extract_checksums(const std::map<std::string, std::string>& headers);

    // The most trustworthy checksum that can be verified, if any.
    static std::optional<integrity_token>
    preferred_token(const std::map<std::string, std::string>& checksums);

    static std::string object_name(const std::string& url,
                                   const std::map<std::string, std::string>& headers);

    // Total from "bytes a-b/N" or "bytes */N"; nullopt when the total is "*" or malformed.
    static std::optional<std::uint64_t> content_range_total(const std::string& value);

private:
    transport& m_transport;
    const session_config& m_config;
};
