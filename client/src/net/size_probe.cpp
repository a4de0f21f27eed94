#include "net/size_probe.hpp"

#include <cctype>
#include <iostream>
#include <thread>

#include "errors.hpp"
#include "log.hpp"
#include "transfer/fetch_protocol.hpp"

namespace {
std::string header_value(const std::map<std::string, std::string>& headers,
                         const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

std::string unquote(const std::string& s) {
    std::string value = trim(s);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

std::optional<std::uint64_t> parse_uint(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value.size() > 19)
        return std::nullopt;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }
    return std::stoull(value);
}

bool is_hex_md5(const std::string& value) {
    if (value.size() != 32)
        return false;
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

struct probe_answer {
    std::uint64_t size;
    bool range_supported;
};

// Throws probe_error for anything that cannot yield a size.
probe_answer interpret(const http_client::response& response) {
    const std::string content_range = header_value(response.headers, "content-range");
    const std::string content_length = header_value(response.headers, "content-length");

    switch (response.status_code) {
    case 206: {
        auto total = size_probe::content_range_total(content_range);
        if (!total)
            throw probe_error("206 response without a usable Content-Range: '" + content_range +
                              "'");
        return {*total, true};
    }
    case 200: {
        auto length = parse_uint(content_length);
        if (!length)
            throw probe_error("response carries no Content-Length");
        auto total = size_probe::content_range_total(content_range);
        if (total && *total != *length) {
            throw probe_error("inconsistent length: Content-Range total " +
                              std::to_string(*total) + ", Content-Length " +
                              std::to_string(*length));
        }
        const std::string accept_ranges = header_value(response.headers, "accept-ranges");
        return {*length, accept_ranges.find("bytes") != std::string::npos};
    }
    case 416: {
        auto total = size_probe::content_range_total(content_range);
        if (!total)
            throw probe_error("range not satisfiable and no object length reported");
        return {*total, true};
    }
    default:
        throw probe_error("unexpected http status " + std::to_string(response.status_code));
    }
}
} // namespace

size_probe::size_probe(transport& transport, const session_config& config)
    : m_transport(transport), m_config(config) {}

remote_object size_probe::run(const std::string& url) {
    std::optional<std::uint64_t> first_size;
    http_client::response response;
    probe_answer answer{0, false};

    for (unsigned attempt = 1;; ++attempt) {
        response = m_transport.probe(url);

        const bool transient =
            response.transport_failed() || is_transient_status(response.status_code);
        if (!transient) {
            answer = interpret(response);
            if (first_size && *first_size != answer.size) {
                throw probe_error("inconsistent length across retries: " +
                                  std::to_string(*first_size) + " then " +
                                  std::to_string(answer.size));
            }
            break;
        }

        // A failed answer may still report a length; later answers must agree with it.
        auto reported = content_range_total(header_value(response.headers, "content-range"));
        if (reported) {
            if (first_size && *first_size != *reported) {
                throw probe_error("inconsistent length across retries: " +
                                  std::to_string(*first_size) + " then " +
                                  std::to_string(*reported));
            }
            first_size = reported;
        }

        std::string reason = response.transport_failed()
                                 ? response.error
                                 : "http status " + std::to_string(response.status_code);
        if (attempt > m_config.max_retries)
            throw probe_error("probe of " + url + " failed: " + reason);

        std::cerr << "[Probe] Attempt " << attempt << " failed (" << reason << "), retrying"
                  << std::endl;
        std::this_thread::sleep_for(retry_delay(attempt, m_config));
    }

    remote_object object;
    object.url = url;
    object.size = answer.size;
    object.range_supported = answer.range_supported;
    object.checksums = extract_checksums(response.headers);
    object.token = preferred_token(object.checksums);
    object.name = object_name(url, response.headers);

    URLSTREAM_LOG(std::cout << "[Probe] " << object.name << ": " << object.size
                            << " bytes, ranges " << (object.range_supported ? "yes" : "no")
                            << std::endl);
    return object;
}

std::map<std::string, std::string>
size_probe::extract_checksums(const std::map<std::string, std::string>& headers) {
    std::map<std::string, std::string> checksums;

    // x-goog-hash: crc32c=n03x6A==,md5=Ojk9c3dhfxgoKVVHYwFbHQ==
    const std::string goog_hash = header_value(headers, "x-goog-hash");
    std::size_t start = 0;
    while (start < goog_hash.size()) {
        std::size_t comma = goog_hash.find(',', start);
        if (comma == std::string::npos)
            comma = goog_hash.size();
        std::string item = trim(goog_hash.substr(start, comma - start));
        std::size_t eq = item.find('=');
        if (eq != std::string::npos) {
            std::string key = item.substr(0, eq);
            std::string value = item.substr(eq + 1);
            if (key == "md5")
                checksums["gs_md5"] = value;
            else if (key == "crc32c")
                checksums["gs_crc32c"] = value;
        }
        start = comma + 1;
    }

    const std::string etag = unquote(header_value(headers, "etag"));
    if (!etag.empty()) {
        if (header_value(headers, "server").find("AmazonS3") != std::string::npos)
            checksums["s3_etag"] = etag;
        else
            checksums["etag"] = etag;
    }

    const std::string content_md5 = trim(header_value(headers, "content-md5"));
    if (!content_md5.empty())
        checksums["md5_base64"] = content_md5;

    return checksums;
}

std::optional<integrity_token>
size_probe::preferred_token(const std::map<std::string, std::string>& checksums) {
    auto it = checksums.find("gs_md5");
    if (it != checksums.end())
        return integrity_token{digest_algorithm::md5_base64, it->second};

    it = checksums.find("gs_crc32c");
    if (it != checksums.end())
        return integrity_token{digest_algorithm::gs_crc32c, it->second};

    it = checksums.find("md5_base64");
    if (it != checksums.end())
        return integrity_token{digest_algorithm::md5_base64, it->second};

    it = checksums.find("s3_etag");
    if (it != checksums.end())
        return integrity_token{digest_algorithm::s3_etag, it->second};

    it = checksums.find("etag");
    if (it != checksums.end() && is_hex_md5(it->second))
        return integrity_token{digest_algorithm::md5, it->second};

    return std::nullopt;
}

std::string size_probe::object_name(const std::string& url,
                                    const std::map<std::string, std::string>& headers) {
    // Content-Disposition: attachment; filename="report.csv"
    const std::string disposition = header_value(headers, "content-disposition");
    std::size_t pos = disposition.find("filename=");
    if (pos != std::string::npos) {
        std::string value = disposition.substr(pos + 9);
        std::size_t semicolon = value.find(';');
        if (semicolon != std::string::npos)
            value.resize(semicolon);
        value = unquote(value);
        std::size_t slash = value.find_last_of("/\\");
        if (slash != std::string::npos)
            value = value.substr(slash + 1);
        if (!value.empty())
            return value;
    }

    std::string path = url;
    std::size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        std::size_t path_start = path.find('/', scheme + 3);
        path = path_start == std::string::npos ? std::string() : path.substr(path_start);
    }
    std::size_t query = path.find_first_of("?#");
    if (query != std::string::npos)
        path.resize(query);
    while (!path.empty() && path.back() == '/')
        path.pop_back();

    std::size_t slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? "download" : name;
}

std::optional<std::uint64_t> size_probe::content_range_total(const std::string& value) {
    std::size_t slash = value.rfind('/');
    if (slash == std::string::npos)
        return std::nullopt;
    return parse_uint(value.substr(slash + 1));
}
