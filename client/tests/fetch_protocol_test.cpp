#include <gtest/gtest.h>

#include "transfer/fetch_protocol.hpp"

namespace {
fetch_request request_at(std::uint64_t offset, std::size_t length) {
    fetch_request request;
    request.part_index = 3;
    request.offset = offset;
    request.length = length;
    request.attempt = 1;
    request.buffer_name = "/urlstream-1-1-0";
    return request;
}

http_client::response answer(int status, std::size_t bytes, bool overflow = false) {
    http_client::response response;
    response.status_code = status;
    response.bytes_received = bytes;
    response.body_overflow = overflow;
    return response;
}
} // namespace

TEST(FetchProtocol, CompleteRangeIsCompleted) {
    auto result = classify_range_response(request_at(100, 50), answer(206, 50));
    EXPECT_EQ(result.status, fetch_status::completed);
    EXPECT_EQ(result.part_index, 3u);
    EXPECT_EQ(result.length, 50u);
}

TEST(FetchProtocol, WholeBodyAtOffsetZeroIsCompleted) {
    EXPECT_EQ(classify_range_response(request_at(0, 50), answer(200, 50)).status,
              fetch_status::completed);
}

TEST(FetchProtocol, IgnoredRangeIsFatal) {
    EXPECT_EQ(classify_range_response(request_at(100, 50), answer(200, 50)).status,
              fetch_status::fatal_error);
    EXPECT_EQ(classify_range_response(request_at(0, 50), answer(200, 50, true)).status,
              fetch_status::fatal_error);
}

TEST(FetchProtocol, ShortPartIsTransient) {
    auto result = classify_range_response(request_at(100, 50), answer(206, 20));
    EXPECT_EQ(result.status, fetch_status::transient_error);
    EXPECT_NE(result.message.find("20 of 50"), std::string::npos);
}

TEST(FetchProtocol, StatusClassification) {
    for (int status : {0, 408, 429, 500, 502, 503, 504}) {
        EXPECT_EQ(classify_range_response(request_at(0, 10), answer(status, 0)).status,
                  fetch_status::transient_error)
            << status;
    }
    for (int status : {400, 401, 403, 404, 410, 416}) {
        EXPECT_EQ(classify_range_response(request_at(0, 10), answer(status, 0)).status,
                  fetch_status::fatal_error)
            << status;
    }
}

TEST(FetchProtocol, RetryDelayDoublesUpToTheCeiling) {
    session_config config;
    config.backoff_base_ms = 100;
    config.backoff_max_ms = 1000;
    EXPECT_EQ(retry_delay(1, config).count(), 100);
    EXPECT_EQ(retry_delay(2, config).count(), 200);
    EXPECT_EQ(retry_delay(3, config).count(), 400);
    EXPECT_EQ(retry_delay(4, config).count(), 800);
    EXPECT_EQ(retry_delay(5, config).count(), 1000);
    EXPECT_EQ(retry_delay(60, config).count(), 1000);
}

TEST(FetchProtocol, MessagesSurviveJson) {
    nlohmann::json j = request_at(4096, 1024);
    EXPECT_EQ(j.at("type"), "fetch");
    auto request = j.get<fetch_request>();
    EXPECT_EQ(request.offset, 4096u);
    EXPECT_EQ(request.buffer_name, "/urlstream-1-1-0");

    fetch_result result;
    result.part_index = 9;
    result.status = fetch_status::transient_error;
    result.http_status = 503;
    result.message = "http status 503";
    nlohmann::json k = result;
    EXPECT_EQ(k.at("type"), "result");
    auto back = k.get<fetch_result>();
    EXPECT_EQ(back.part_index, 9u);
    EXPECT_EQ(back.status, fetch_status::transient_error);
    EXPECT_EQ(back.http_status, 503);
}
