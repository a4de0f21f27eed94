#include <gtest/gtest.h>

#include "errors.hpp"
#include "integrity/integrity_verifier.hpp"
#include "support/memory_transport.hpp"

using test_support::make_object;

namespace {
void feed(integrity_verifier& verifier, const std::vector<std::uint8_t>& bytes) {
    for (std::size_t offset = 0; offset < bytes.size(); offset += 100)
        verifier.update(bytes.data() + offset, std::min<std::size_t>(100, bytes.size() - offset));
}
} // namespace

TEST(IntegrityVerifier, MatchingChecksumPasses) {
    integrity_verifier verifier(
        integrity_token{digest_algorithm::md5_base64, "tzTQV3XW5sVLzHhJQLZEQw=="}, 1000);
    ASSERT_TRUE(verifier.active());
    feed(verifier, make_object(1000));
    EXPECT_NO_THROW(verifier.finish());
    EXPECT_TRUE(verifier.finished());
    EXPECT_EQ(verifier.bytes_digested(), 1000u);
}

TEST(IntegrityVerifier, HexComparisonIgnoresCase) {
    integrity_verifier verifier(
        integrity_token{digest_algorithm::md5, "B734D05775D6E6C54BCC784940B64443"}, 1000);
    feed(verifier, make_object(1000));
    EXPECT_NO_THROW(verifier.finish());
}

TEST(IntegrityVerifier, MismatchReportsBothValues) {
    integrity_verifier verifier(
        integrity_token{digest_algorithm::md5, "00000000000000000000000000000000"}, 1000);
    feed(verifier, make_object(1000));
    try {
        verifier.finish();
        FAIL() << "expected integrity_error";
    } catch (const integrity_error& e) {
        EXPECT_EQ(e.expected(), "00000000000000000000000000000000");
        EXPECT_EQ(e.actual(), "b734d05775d6e6c54bcc784940b64443");
    }
    // Verdict is given once
    EXPECT_NO_THROW(verifier.finish());
}

TEST(IntegrityVerifier, NonAsciiExpectedValueIsAMismatch) {
    integrity_verifier verifier(
        integrity_token{digest_algorithm::md5, "b734d05775d6e6c54bcc784940b6444\xe9"}, 1000);
    feed(verifier, make_object(1000));
    EXPECT_THROW(verifier.finish(), integrity_error);
}

TEST(IntegrityVerifier, Crc32cTokenIsVerified) {
    integrity_verifier verifier(integrity_token{digest_algorithm::gs_crc32c, "yvaPFQ=="}, 1000);
    ASSERT_TRUE(verifier.active());
    feed(verifier, make_object(1000));
    EXPECT_NO_THROW(verifier.finish());
}

TEST(IntegrityVerifier, ImplausibleEtagDeliversUnverified) {
    integrity_verifier verifier(
        integrity_token{digest_algorithm::s3_etag,
                        "0123456789abcdef0123456789abcdef-17592186044417"},
        8 * test_support::MiB);
    EXPECT_FALSE(verifier.active());
    EXPECT_NO_THROW(verifier.finish());
}

TEST(IntegrityVerifier, MissingBytesFail) {
    integrity_verifier verifier(
        integrity_token{digest_algorithm::md5, "b734d05775d6e6c54bcc784940b64443"}, 1000);
    auto bytes = make_object(1000);
    verifier.update(bytes.data(), 999);
    EXPECT_THROW(verifier.finish(), integrity_error);
}

TEST(IntegrityVerifier, NullAlgorithmAcceptsAnything) {
    integrity_verifier verifier(integrity_token{digest_algorithm::null, "whatever"}, 1000);
    EXPECT_TRUE(verifier.active());
    feed(verifier, make_object(1000));
    EXPECT_NO_THROW(verifier.finish());
}

TEST(IntegrityVerifier, NoTokenMeansNothingToCheck) {
    integrity_verifier verifier(std::nullopt, 1000);
    EXPECT_FALSE(verifier.active());
    EXPECT_NO_THROW(verifier.finish());
}
