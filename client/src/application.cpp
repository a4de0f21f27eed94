#include "application.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <system_error>

#include "errors.hpp"
#include "log.hpp"
#include "util/byte_utils.hpp"

namespace {
constexpr int exit_success = 0;
constexpr int exit_failure = 1;
constexpr int exit_usage = 2;

const char* next_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc)
        throw config_error(std::string("missing value for ") + argv[i]);
    return argv[++i];
}
} // namespace

application::application() : m_mode(application_mode::single) {}

application::~application() = default;

int application::run(int argc, char** argv) {
    try {
        if (!parse_arguments(argc, argv)) {
            print_usage(argv[0]);
            return exit_usage;
        }
    } catch (const config_error& e) {
        std::cerr << "[Client] " << e.what() << std::endl;
        print_usage(argv[0]);
        return exit_usage;
    }

    return run_downloads();
}

bool application::parse_arguments(int argc, char** argv) {
    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> manifest_path;
    std::optional<std::string> concurrency;
    std::optional<std::string> chunk_size;
    std::optional<std::string> checksum;
    std::optional<std::string> checksum_algorithm;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config") {
            config_path = next_value(argc, argv, i);
        } else if (arg == "--manifest" || arg == "-m") {
            manifest_path = next_value(argc, argv, i);
        } else if (arg == "--concurrency") {
            concurrency = next_value(argc, argv, i);
        } else if (arg == "--chunk-size") {
            chunk_size = next_value(argc, argv, i);
        } else if (arg == "--checksum") {
            checksum = next_value(argc, argv, i);
        } else if (arg == "--checksum-algorithm") {
            checksum_algorithm = next_value(argc, argv, i);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw config_error("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    // Configuration file first, then individual overrides
    m_config = config_path ? load_session_config(*config_path) : session_config();
    if (concurrency) {
        if (*concurrency == "disabled") {
            m_config.concurrency = session_config::concurrency_disabled;
        } else {
            if (concurrency->empty() || concurrency->size() > 6 ||
                concurrency->find_first_not_of("0123456789") != std::string::npos)
                throw config_error("--concurrency takes a number or \"disabled\"");
            m_config.concurrency = std::stoul(*concurrency);
        }
    }
    if (chunk_size) {
        auto value = byte_utils::parse_bytes(*chunk_size);
        if (!value)
            throw config_error("cannot parse --chunk-size " + *chunk_size);
        m_config.chunk_size = *value;
    }
    m_config.validate();

    if (checksum.has_value() != checksum_algorithm.has_value())
        throw config_error("--checksum and --checksum-algorithm go together");

    if (manifest_path) {
        if (!positional.empty() || checksum)
            throw config_error("--manifest cannot be combined with a url or checksum");
        m_mode = application_mode::manifest;
        m_requests = load_manifest(*manifest_path);
        return true;
    }

    if (positional.empty() || positional.size() > 2)
        return false;

    m_mode = application_mode::single;
    download_request request;
    request.url = positional[0];
    if (positional.size() == 2)
        request.filepath = positional[1];
    if (checksum) {
        auto algorithm = parse_digest_algorithm(*checksum_algorithm);
        if (!algorithm)
            throw config_error("unknown checksum algorithm " + *checksum_algorithm);
        request.checksum = integrity_token{*algorithm, *checksum};
    }
    m_requests.push_back(request);
    return true;
}

int application::run_downloads() {
    downloader client(m_config);
    int status = exit_success;

    for (const auto& request : m_requests) {
        try {
            auto result = client.download(request);
            URLSTREAM_LOG(std::cout << "[Client] Saved " << result.path << " ("
                                    << result.bytes << " bytes"
                                    << (result.verified ? ", verified" : ", unverified") << ")"
                                    << std::endl);
        } catch (const config_error& e) {
            std::cerr << "\n[Client] " << request.url << ": " << e.what() << std::endl;
            return exit_usage;
        } catch (const urlstream_error& e) {
            std::cerr << "\n[Client] " << request.url << ": " << e.what() << std::endl;
            status = exit_failure;
        } catch (const std::system_error& e) {
            std::cerr << "\n[Client] " << request.url << ": " << e.what() << std::endl;
            status = exit_failure;
        }
    }
    return status;
}

void application::print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <url> [destination] [options]\n"
              << "       " << program << " --manifest FILE [--config FILE]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE              JSON session configuration\n"
              << "  --concurrency N|disabled   worker processes (default 4)\n"
              << "  --chunk-size BYTES         bytes per part, e.g. 4M (default 4M)\n"
              << "  --checksum VALUE           expected checksum\n"
              << "  --checksum-algorithm NAME  md5, md5_base64, gs_crc32c, sha256, s3_etag\n"
              << "                             or null\n"
              << "  --manifest FILE            JSON list of {url, filepath, checksum,\n"
              << "                             checksum-algorithm}\n";
}
