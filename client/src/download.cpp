#include "download.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>

#include "errors.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "url_stream.hpp"
#include "util/defer.hpp"

namespace {
// Large enough to keep the stream busy, small enough for a smooth progress bar.
constexpr std::size_t copy_block_size = 1024 * 1024;

download_request parse_entry(const nlohmann::json& entry, std::size_t position) {
    const std::string where = "manifest entry " + std::to_string(position);
    if (!entry.is_object())
        throw config_error(where + " is not an object");

    download_request request;
    auto url = entry.find("url");
    if (url == entry.end() || !url->is_string() || url->get<std::string>().empty())
        throw config_error(where + " needs a \"url\" string");
    request.url = url->get<std::string>();

    auto filepath = entry.find("filepath");
    if (filepath != entry.end()) {
        if (!filepath->is_string())
            throw config_error(where + ": \"filepath\" must be a string");
        request.filepath = filepath->get<std::string>();
    }

    auto checksum = entry.find("checksum");
    auto algorithm = entry.find("checksum-algorithm");
    if ((checksum == entry.end()) != (algorithm == entry.end()))
        throw config_error(where + ": \"checksum\" and \"checksum-algorithm\" go together");
    if (checksum != entry.end()) {
        if (!checksum->is_string() || !algorithm->is_string())
            throw config_error(where + ": checksum fields must be strings");
        auto parsed = parse_digest_algorithm(algorithm->get<std::string>());
        if (!parsed)
            throw config_error(where + ": unknown checksum algorithm \"" +
                               algorithm->get<std::string>() + "\"");
        request.checksum = integrity_token{*parsed, checksum->get<std::string>()};
    }
    return request;
}
} // namespace

std::vector<download_request> parse_manifest(const nlohmann::json& manifest) {
    if (!manifest.is_array())
        throw config_error("manifest must be a JSON array");

    std::vector<download_request> requests;
    for (std::size_t i = 0; i < manifest.size(); ++i)
        requests.push_back(parse_entry(manifest[i], i));
    return requests;
}

std::vector<download_request> load_manifest(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw config_error("cannot open manifest: " + path);

    try {
        return parse_manifest(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error("manifest " + path + " is not valid JSON: " + e.what());
    }
}

std::string resolve_destination(const std::string& requested, const remote_object& object) {
    if (requested.empty())
        return object.name;

    std::error_code ec;
    if (std::filesystem::is_directory(requested, ec))
        return (std::filesystem::path(requested) / object.name).string();
    return requested;
}

downloader::downloader(const session_config& config, transport_factory factory,
                       std::ostream* progress_out)
    : m_config(config), m_factory(std::move(factory)), m_progress_out(progress_out) {}

download_result downloader::download(const download_request& request) {
    stream_options options;
    options.checksum = request.checksum;
    auto stream = url_stream::open(request.url, m_config, m_factory, options);

    download_result result;
    result.path = resolve_destination(request.filepath, stream->object());
    result.verified = stream->verifying();

    std::filesystem::path destination(result.path);
    std::filesystem::path temp_path =
        destination.parent_path() /
        (".urlstream-" + destination.filename().string() + "-" + std::to_string(getpid()));

    URLSTREAM_LOG(std::cout << "[Download] " << request.url << " -> " << result.path
                            << " (via " << temp_path.string() << ")" << std::endl);

    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::system_error(errno, std::generic_category(),
                                "cannot create " + temp_path.string());
    }
    auto remove_temp = make_deferred([&]() {
        out.close();
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
    });

    std::optional<progress_bar> progress;
    if (m_progress_out)
        progress.emplace(destination.filename().string(), stream->size(), *m_progress_out);

    std::vector<std::uint8_t> block(copy_block_size);
    for (;;) {
        std::size_t n = stream->read(block.data(), block.size());
        if (n == 0)
            break;
        out.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(n));
        if (!out)
            throw std::system_error(errno, std::generic_category(),
                                    "write to " + temp_path.string() + " failed");
        result.bytes += n;
        if (progress)
            progress->add(n);
    }
    stream->close();

    if (result.bytes != stream->size()) {
        throw fetch_error("download of " + request.url + " stopped after " +
                          std::to_string(result.bytes) + " of " +
                          std::to_string(stream->size()) + " bytes");
    }

    out.close();
    if (!out)
        throw std::system_error(errno, std::generic_category(),
                                "closing " + temp_path.string() + " failed");

    std::filesystem::rename(temp_path, destination);
    remove_temp.dismiss();

    if (progress)
        progress->finish();
    return result;
}
