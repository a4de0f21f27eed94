#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "integrity/digest.hpp"
#include "url_stream.hpp"
#include "support/memory_transport.hpp"

using test_support::MiB;
using test_support::memory_factory;
using test_support::memory_server;

namespace {
const char* const url = "https://storage.example.test/bucket/object.bin?signature=abc";
const char* const ten_mib_md5_base64 = "dFfc6fWFqqoSZT93kKsUpw==";
const char* const ten_mib_md5_hex = "7457dce9f585aaaa12653f7790ab14a7";
const char* const ten_mib_sha256 =
    "7f0d9b9c7bf2c46c2712178ea691b93bdee3918698cc61925102316ccfcb21ac";

session_config test_config(std::size_t concurrency = 4, std::uint64_t chunk_size = MiB) {
    session_config config;
    config.concurrency = concurrency;
    config.chunk_size = chunk_size;
    config.max_retries = 3;
    config.backoff_base_ms = 1;
    config.backoff_max_ms = 5;
    return config;
}

std::vector<std::uint8_t> read_all(url_stream& stream, std::size_t block = 300 * 1024) {
    std::vector<std::uint8_t> out;
    for (;;) {
        auto bytes = stream.read(block);
        if (bytes.empty())
            break;
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

std::string md5_hex(const std::vector<std::uint8_t>& bytes) {
    auto digest = make_digest(integrity_token{digest_algorithm::md5, ""}, bytes.size());
    digest->update(bytes.data(), bytes.size());
    return digest->finish().front();
}
} // namespace

TEST(UrlStream, ConcurrentDownloadMatchesObject) {
    auto server = memory_server::make(10 * MiB);
    server->extra_headers["content-md5"] = ten_mib_md5_base64;

    auto stream = url_stream::open(url, test_config(), memory_factory(server));
    EXPECT_EQ(stream->size(), 10 * MiB);
    EXPECT_TRUE(stream->verifying());
    EXPECT_EQ(stream->parts().size(), 10u);

    auto bytes = read_all(*stream);
    EXPECT_EQ(bytes.size(), 10 * MiB);
    EXPECT_TRUE(bytes == server->bytes);
    EXPECT_EQ(md5_hex(bytes), ten_mib_md5_hex);
    EXPECT_EQ(stream->tell(), 10 * MiB);

    auto stats = stream->stats();
    EXPECT_TRUE(stats.concurrent);
    EXPECT_EQ(stats.parts_total, 10u);
    EXPECT_LE(stats.pool.peak_in_use, test_config().effective_pool_size());
    for (const auto& p : stream->parts())
        EXPECT_EQ(p.state, part_state::released);

    // Reads past the end keep returning nothing
    EXPECT_TRUE(stream->read(10).empty());
}

TEST(UrlStream, DisabledConcurrencyGivesSameBytes) {
    auto server = memory_server::make(10 * MiB);
    auto stream = url_stream::open(url, test_config(session_config::concurrency_disabled),
                                   memory_factory(server));
    EXPECT_FALSE(stream->stats().concurrent);
    EXPECT_FALSE(stream->verifying());
    EXPECT_TRUE(read_all(*stream) == server->bytes);
}

TEST(UrlStream, ServerWithoutRangesFallsBackToSequential) {
    auto server = memory_server::make(3158073);
    server->range_supported = false;
    auto stream = url_stream::open(url, test_config(), memory_factory(server));
    EXPECT_FALSE(stream->stats().concurrent);
    EXPECT_TRUE(read_all(*stream, 4096) == server->bytes);
}

TEST(UrlStream, ShortLastPart) {
    auto server = memory_server::make(3158073);
    server->extra_headers["content-md5"] = "kOV+RzPRG+y9CZOk4r2uEg==";
    auto stream = url_stream::open(url, test_config(3), memory_factory(server));

    auto parts = stream->parts();
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts.back().length, 3158073 - 3 * MiB);
    EXPECT_TRUE(read_all(*stream, 1000003) == server->bytes);
}

TEST(UrlStream, TransientFailuresAreRetried) {
    auto server = memory_server::make(10 * MiB);
    server->extra_headers["content-md5"] = ten_mib_md5_base64;
    server->range_failures[3 * MiB] = {503, 0};

    auto stream = url_stream::open(url, test_config(), memory_factory(server));
    EXPECT_TRUE(read_all(*stream) == server->bytes);
    EXPECT_EQ(stream->parts()[3].attempts, 3u);
    EXPECT_EQ(stream->parts()[2].attempts, 1u);
}

TEST(UrlStream, ExhaustedRetriesFailThePart) {
    auto server = memory_server::make(4 * MiB);
    server->range_failures[2 * MiB] = {503, 503, 503, 503};

    auto stream = url_stream::open(url, test_config(2), memory_factory(server));
    try {
        read_all(*stream);
        FAIL() << "expected fetch_error";
    } catch (const fetch_error& e) {
        EXPECT_EQ(e.part_index(), 2u);
        EXPECT_EQ(e.http_status(), 503);
    }
    EXPECT_EQ(stream->parts()[2].state, part_state::failed);
    EXPECT_EQ(stream->parts()[2].attempts, 4u);
}

TEST(UrlStream, FatalStatusIsNotRetried) {
    auto server = memory_server::make(4 * MiB);
    server->range_failures[1 * MiB] = {404};

    auto stream = url_stream::open(url, test_config(2), memory_factory(server));
    try {
        read_all(*stream);
        FAIL() << "expected fetch_error";
    } catch (const fetch_error& e) {
        EXPECT_EQ(e.part_index(), 1u);
        EXPECT_EQ(e.http_status(), 404);
    }
    EXPECT_EQ(stream->parts()[1].attempts, 1u);

    // The failure sticks
    EXPECT_THROW(stream->read(1), fetch_error);
    EXPECT_THROW(stream->next_chunk(), fetch_error);
}

TEST(UrlStream, OrderSurvivesReversedCompletion) {
    auto server = memory_server::make(6 * MiB);
    for (std::uint64_t i = 0; i < 6; ++i)
        server->latency_ms[i * MiB] = static_cast<int>((6 - i) * 40);

    auto stream = url_stream::open(url, test_config(6), memory_factory(server));
    EXPECT_TRUE(read_all(*stream) == server->bytes);
    EXPECT_LE(stream->stats().pool.peak_in_use, test_config(6).effective_pool_size());
}

TEST(UrlStream, SmallPoolStillCompletes) {
    auto server = memory_server::make(8 * MiB);
    session_config config = test_config(2);
    config.pool_size = 2;
    server->latency_ms[0] = 50;

    auto stream = url_stream::open(url, config, memory_factory(server));
    EXPECT_TRUE(read_all(*stream) == server->bytes);
    EXPECT_LE(stream->stats().pool.peak_in_use, 2u);
}

TEST(UrlStream, PoolSmallerThanConcurrencyIsRejected) {
    auto server = memory_server::make(MiB);
    session_config config = test_config(4);
    config.pool_size = 3;
    EXPECT_THROW(url_stream::open(url, config, memory_factory(server)), config_error);
}

TEST(UrlStream, UnreachableObjectFailsToOpen) {
    auto server = memory_server::make(MiB);
    server->probe_script.assign(10, test_support::make_response(404, {}));
    EXPECT_THROW(url_stream::open(url, test_config(), memory_factory(server)), probe_error);
}

TEST(UrlStream, ChecksumMismatchAfterFullDelivery) {
    auto server = memory_server::make(1000);
    server->extra_headers["content-md5"] = "1B2M2Y8AsgTpgAmY7PhCfg==";

    auto stream = url_stream::open(url, test_config(2, 256), memory_factory(server));
    std::vector<std::uint8_t> buffer(1000);
    EXPECT_EQ(stream->read(buffer.data(), buffer.size()), 1000u);
    EXPECT_TRUE(buffer == server->bytes);
    EXPECT_THROW(stream->read(buffer.data(), 1), integrity_error);
}

TEST(UrlStream, CallerChecksumOverridesProbe) {
    auto server = memory_server::make(10 * MiB);
    server->extra_headers["content-md5"] = "1B2M2Y8AsgTpgAmY7PhCfg==";

    stream_options options;
    options.checksum = integrity_token{digest_algorithm::sha256, ten_mib_sha256};
    auto stream = url_stream::open(url, test_config(), memory_factory(server), options);
    EXPECT_TRUE(stream->verifying());
    EXPECT_EQ(read_all(*stream).size(), 10 * MiB);
}

TEST(UrlStream, GoogleCrc32cIsVerified) {
    auto server = memory_server::make(10 * MiB);
    server->extra_headers["x-goog-hash"] = "crc32c=2r0zvw==";
    auto stream = url_stream::open(url, test_config(), memory_factory(server));
    EXPECT_TRUE(stream->verifying());
    EXPECT_TRUE(read_all(*stream) == server->bytes);
}

TEST(UrlStream, ImplausibleS3EtagDeliversUnverified) {
    auto server = memory_server::make(8 * MiB);
    server->extra_headers["server"] = "AmazonS3";
    server->extra_headers["etag"] = "\"0123456789abcdef0123456789abcdef-17592186044417\"";
    auto stream = url_stream::open(url, test_config(), memory_factory(server));
    EXPECT_FALSE(stream->verifying());
    EXPECT_TRUE(read_all(*stream) == server->bytes);
}

TEST(UrlStream, EmptyObject) {
    auto server = memory_server::make(0);
    server->extra_headers["content-md5"] = "1B2M2Y8AsgTpgAmY7PhCfg==";
    auto stream = url_stream::open(url, test_config(), memory_factory(server));
    EXPECT_EQ(stream->size(), 0u);
    EXPECT_TRUE(stream->parts().empty());
    EXPECT_TRUE(stream->read(100).empty());
    EXPECT_FALSE(stream->next_chunk().has_value());
}

TEST(UrlStream, CloseStopsReads) {
    auto server = memory_server::make(4 * MiB);
    auto stream = url_stream::open(url, test_config(2), memory_factory(server));
    EXPECT_EQ(stream->read(10).size(), 10u);

    stream->close();
    EXPECT_TRUE(stream->closed());
    EXPECT_TRUE(stream->read(10).empty());
    EXPECT_FALSE(stream->next_chunk().has_value());
    stream->close();
}

TEST(UrlStream, CloseFromAnotherThreadUnblocksRead) {
    auto server = memory_server::make(2 * MiB);
    server->latency_ms[0] = 3000;
    auto stream = url_stream::open(url, test_config(2), memory_factory(server));

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stream->close();
    });

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(stream->read(100).empty());
    closer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2500));
}

TEST(UrlStream, ReadNeedsOrderedDelivery) {
    auto server = memory_server::make(MiB);
    stream_options options;
    options.order = delivery_order::unordered;
    auto stream = url_stream::open(url, test_config(), memory_factory(server), options);
    EXPECT_FALSE(stream->verifying());
    std::uint8_t byte;
    EXPECT_THROW(stream->read(&byte, 1), std::logic_error);
}

TEST(UrlStream, NextChunkAfterPartialRead) {
    auto server = memory_server::make(3 * MiB);
    auto stream = url_stream::open(url, test_config(2), memory_factory(server));
    ASSERT_EQ(stream->read(100).size(), 100u);

    auto chunk = stream->next_chunk();
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->index, 0u);
    EXPECT_EQ(chunk->offset, 100u);
    EXPECT_EQ(chunk->length, MiB - 100);
    EXPECT_TRUE(std::equal(chunk->data(), chunk->data() + chunk->length,
                           server->bytes.begin() + 100));
}

TEST(ChunkRange, OrderedIteration) {
    auto server = memory_server::make(5 * MiB + 7);
    server->extra_headers["content-md5"] = "cSJBflEsDHGbdBd/SjB5mw==";

    auto range = iterate(url, test_config(3), memory_factory(server));
    std::uint64_t expected_offset = 0;
    for (const auto& chunk : range) {
        EXPECT_EQ(chunk.offset, expected_offset);
        EXPECT_TRUE(std::equal(chunk.data(), chunk.data() + chunk.length,
                               server->bytes.begin() + chunk.offset));
        expected_offset += chunk.length;
    }
    EXPECT_EQ(expected_offset, 5 * MiB + 7);
    EXPECT_THROW(range.begin(), std::logic_error);
}

TEST(ChunkRange, UnorderedIterationCoversEveryOffset) {
    auto server = memory_server::make(6 * MiB);
    server->latency_ms[0] = 200;

    auto range = iterate_unordered(url, test_config(3), memory_factory(server));
    std::set<std::uint64_t> offsets;
    for (const auto& chunk : range) {
        EXPECT_EQ(chunk.length, MiB);
        EXPECT_TRUE(std::equal(chunk.data(), chunk.data() + chunk.length,
                               server->bytes.begin() + chunk.offset));
        EXPECT_TRUE(offsets.insert(chunk.offset).second);
    }
    EXPECT_EQ(offsets.size(), 6u);
}
