#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

#include "download.hpp"
#include "errors.hpp"
#include "progress.hpp"
#include "util/byte_utils.hpp"
#include "support/memory_transport.hpp"

using test_support::MiB;
using test_support::memory_factory;
using test_support::memory_server;

namespace fs = std::filesystem;

namespace {
class DownloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = fs::temp_directory_path() /
                ("urlstream-download-test-" + std::to_string(getpid()) + "-" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    session_config config() const {
        session_config config;
        config.concurrency = 2;
        config.chunk_size = 256 * 1024;
        config.backoff_base_ms = 1;
        config.backoff_max_ms = 5;
        return config;
    }

    std::vector<std::uint8_t> read_file(const fs::path& path) const {
        std::ifstream in(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                         std::istreambuf_iterator<char>());
    }

    std::size_t entry_count() const {
        return static_cast<std::size_t>(
            std::distance(fs::directory_iterator(m_dir), fs::directory_iterator()));
    }

    fs::path m_dir;
};
} // namespace

TEST_F(DownloadTest, WritesVerifiedObject) {
    auto server = memory_server::make(3158073);
    server->extra_headers["content-md5"] = "kOV+RzPRG+y9CZOk4r2uEg==";

    std::ostringstream progress;
    downloader d(config(), memory_factory(server), &progress);
    download_request request;
    request.url = "https://host.test/files/archive.bin?sig=1";
    request.filepath = (m_dir / "out.bin").string();

    auto result = d.download(request);
    EXPECT_EQ(result.path, request.filepath);
    EXPECT_EQ(result.bytes, 3158073u);
    EXPECT_TRUE(result.verified);
    EXPECT_TRUE(read_file(result.path) == server->bytes);
    EXPECT_EQ(entry_count(), 1u);
    EXPECT_NE(progress.str().find("100%"), std::string::npos);
}

TEST_F(DownloadTest, DirectoryDestinationUsesObjectName) {
    auto server = memory_server::make(1000);
    downloader d(config(), memory_factory(server), nullptr);

    download_request request;
    request.url = "https://host.test/files/archive.bin?sig=1";
    request.filepath = m_dir.string();
    request.checksum = integrity_token{digest_algorithm::md5, "b734d05775d6e6c54bcc784940b64443"};

    auto result = d.download(request);
    EXPECT_EQ(fs::path(result.path), m_dir / "archive.bin");
    EXPECT_TRUE(result.verified);
    EXPECT_EQ(fs::file_size(result.path), 1000u);
}

TEST_F(DownloadTest, IntegrityFailureLeavesNothingBehind) {
    auto server = memory_server::make(1000);
    server->extra_headers["content-md5"] = "1B2M2Y8AsgTpgAmY7PhCfg==";
    downloader d(config(), memory_factory(server), nullptr);

    download_request request;
    request.url = "https://host.test/object";
    request.filepath = (m_dir / "object").string();

    EXPECT_THROW(d.download(request), integrity_error);
    EXPECT_EQ(entry_count(), 0u);
}

TEST_F(DownloadTest, FailedPartLeavesNothingBehind) {
    auto server = memory_server::make(MiB);
    server->range_failures[512 * 1024] = {403};
    downloader d(config(), memory_factory(server), nullptr);

    download_request request;
    request.url = "https://host.test/object";
    request.filepath = (m_dir / "object").string();

    EXPECT_THROW(d.download(request), fetch_error);
    EXPECT_EQ(entry_count(), 0u);
}

TEST(Manifest, ParsesEntries) {
    auto requests = parse_manifest(nlohmann::json::parse(R"([
        {"url": "https://a.test/x", "filepath": "x.bin"},
        {"url": "https://a.test/y", "checksum": "abc", "checksum-algorithm": "sha256"},
        {"url": "https://a.test/z", "checksum": "yvaPFQ==", "checksum-algorithm": "gs_crc32c"}
    ])"));
    ASSERT_EQ(requests.size(), 3u);
    ASSERT_TRUE(requests[2].checksum.has_value());
    EXPECT_EQ(requests[2].checksum->algorithm, digest_algorithm::gs_crc32c);
    EXPECT_EQ(requests[0].filepath, "x.bin");
    EXPECT_FALSE(requests[0].checksum.has_value());
    EXPECT_TRUE(requests[1].filepath.empty());
    ASSERT_TRUE(requests[1].checksum.has_value());
    EXPECT_EQ(requests[1].checksum->algorithm, digest_algorithm::sha256);
    EXPECT_EQ(requests[1].checksum->expected, "abc");
}

TEST(Manifest, RejectsMalformedEntries) {
    EXPECT_THROW(parse_manifest(nlohmann::json::object()), config_error);
    EXPECT_THROW(parse_manifest(nlohmann::json::parse(R"([42])")), config_error);
    EXPECT_THROW(parse_manifest(nlohmann::json::parse(R"([{"filepath": "x"}])")), config_error);
    EXPECT_THROW(parse_manifest(nlohmann::json::parse(R"([{"url": "u", "checksum": "abc"}])")),
                 config_error);
    EXPECT_THROW(parse_manifest(nlohmann::json::parse(
                     R"([{"url": "u", "checksum": "abc", "checksum-algorithm": "crc64"}])")),
                 config_error);
    EXPECT_THROW(load_manifest("/nonexistent/manifest.json"), config_error);
}

TEST(Destination, EmptyRequestUsesObjectName) {
    remote_object object;
    object.name = "report.csv";
    EXPECT_EQ(resolve_destination("", object), "report.csv");
    EXPECT_EQ(resolve_destination("/tmp/does-not-exist-urlstream/out.csv", object),
              "/tmp/does-not-exist-urlstream/out.csv");
}

TEST(ProgressBar, RendersFraction) {
    std::ostringstream out;
    progress_bar bar("obj", 1000, out, 10);
    bar.add(500);
    EXPECT_EQ(bar.render(1.5), "obj  50% [=====     ] 500 B/1000 B 1.50s");
    EXPECT_EQ(bar.progress(), 500u);
    EXPECT_NE(out.str().find('\r'), std::string::npos);

    bar.add(500);
    EXPECT_THROW(bar.add(1), std::logic_error);
    bar.finish();
    EXPECT_NE(out.str().find("100%"), std::string::npos);
}

TEST(ByteUtils, FormatAndParse) {
    EXPECT_EQ(byte_utils::format_bytes(512), "512 B");
    EXPECT_EQ(byte_utils::format_bytes(4 * MiB), "4.00 MiB");
    EXPECT_EQ(byte_utils::parse_bytes("4M").value_or(0), 4 * MiB);
    EXPECT_EQ(byte_utils::parse_bytes("512KiB").value_or(0), 512u * 1024);
    EXPECT_EQ(byte_utils::parse_bytes("1048576").value_or(0), MiB);
    EXPECT_FALSE(byte_utils::parse_bytes("4X").has_value());
    EXPECT_FALSE(byte_utils::parse_bytes("M").has_value());
}
