#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "integrity/digest.hpp"
#include "net/size_probe.hpp"
#include "net/transport.hpp"
#include "session_config.hpp"

struct download_request {
    std::string url;
    std::string filepath; // file or existing directory; empty means the probed name
    std::optional<integrity_token> checksum;
};

struct download_result {
    std::string path;
    std::uint64_t bytes = 0;
    bool verified = false;
};

// Manifest: [{"url": ..., "filepath": ..., "checksum": ..., "checksum-algorithm": ...}]
// Throws config_error.
std::vector<download_request> parse_manifest(const nlohmann::json& manifest);
std::vector<download_request> load_manifest(const std::string& path);

// `requested` itself, or the object's name inside it when it is a directory.
std::string resolve_destination(const std::string& requested, const remote_object& object);

class downloader {
public:
    explicit downloader(const session_config& config, transport_factory factory = nullptr,
                        std::ostream* progress_out = &std::cout);

    // Streams the object into a hidden file next to the destination and renames it into
    // place once every byte arrived and verified. Throws urlstream_error or
    // std::system_error; the hidden file is removed on failure.
    download_result download(const download_request& request);

private:
    session_config m_config;
    transport_factory m_factory;
    std::ostream* m_progress_out;
};
