#include <gtest/gtest.h>
#include <latbench/bench/outcome.h>

#include <string>

using namespace latbench::bench;

TEST(ClassificationTest, ReasonCodes) {
    EXPECT_EQ(Classification::ok().reasonCode(), "ok");
    EXPECT_EQ(Classification::httpFailure(503, "HTTP 503").reasonCode(), "http:503");
    EXPECT_EQ(Classification::transportFailure(TransportErrorKind::ReadTimeout, "t").reasonCode(),
              "transport:read_timeout");
    EXPECT_EQ(Classification::failure(FailureKind::ParseError, "x").reasonCode(), "parse_error");
    EXPECT_EQ(Classification::failure(FailureKind::EmptyResult, "x").reasonCode(), "empty_result");
}

TEST(ClassificationTest, TransportFailureNeverReportsNone) {
    auto c = Classification::transportFailure(TransportErrorKind::None, "weird");
    EXPECT_FALSE(c.success());
    EXPECT_EQ(c.transport, TransportErrorKind::Other);
}

TEST(OutcomeTest, ErrorDetailOnlyForFailures) {
    RequestOutcome ok;
    EXPECT_FALSE(ok.errorDetail().has_value());

    RequestOutcome failed;
    failed.classification = Classification::failure(FailureKind::ReportedError, "API Error: bad key");
    ASSERT_TRUE(failed.errorDetail().has_value());
    EXPECT_EQ(*failed.errorDetail(), "API Error: bad key");
}

TEST(OutcomeTest, ErrorDetailFallsBackToReasonCode) {
    RequestOutcome failed;
    failed.classification = Classification::httpFailure(429, "");
    EXPECT_EQ(failed.errorDetail().value_or(""), "http:429");
}

TEST(TruncateErrorTextTest, KeepsFirstLineOnly) {
    EXPECT_EQ(truncateErrorText("first line\nsecond line"), "first line");
    EXPECT_EQ(truncateErrorText("carriage\r\nreturn"), "carriage");
}

TEST(TruncateErrorTextTest, CapsLength) {
    std::string longText(400, 'x');
    auto out = truncateErrorText(longText);
    EXPECT_EQ(out.size(), 303u);
    EXPECT_EQ(out.substr(300), "...");

    std::string exact(300, 'y');
    EXPECT_EQ(truncateErrorText(exact), exact);
}
