#include <gtest/gtest.h>
#include <latbench/bench/response_classifier.h>

using namespace latbench::bench;

namespace {

RawResponse ok(std::string body) {
    RawResponse r;
    r.status = 200;
    r.body = std::move(body);
    return r;
}

} // namespace

TEST(ResponseClassifierTest, TransportErrorWins) {
    RawResponse r;
    r.transportError = TransportErrorKind::ConnectTimeout;
    r.transportMessage = "Timeout was reached";
    r.status = 500;
    auto c = classify(r, serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::Transport);
    EXPECT_EQ(c.transport, TransportErrorKind::ConnectTimeout);
    EXPECT_EQ(c.detail, "Timeout was reached");
}

TEST(ResponseClassifierTest, MissingStatusIsTransportFailure) {
    RawResponse r;
    auto c = classify(r, jsonObjectRules());
    EXPECT_EQ(c.kind, FailureKind::Transport);
    EXPECT_EQ(c.detail, "No HTTP status received");
}

TEST(ResponseClassifierTest, UnexpectedStatusBeforeBodyChecks) {
    RawResponse r;
    r.status = 503;
    r.body = "not json at all";
    auto c = classify(r, serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::HttpStatus);
    ASSERT_TRUE(c.httpStatus.has_value());
    EXPECT_EQ(*c.httpStatus, 503);
    EXPECT_EQ(c.detail, "HTTP 503");
}

TEST(ResponseClassifierTest, InvalidJson) {
    auto c = classify(ok("<html>oops</html>"), serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::ParseError);
    EXPECT_EQ(c.detail, "Invalid JSON response");

    // A JSON array is well-formed but not an object.
    EXPECT_EQ(classify(ok("[1,2,3]"), jsonObjectRules()).kind, FailureKind::ParseError);
}

TEST(ResponseClassifierTest, MissingMetadataCarriesErrorText) {
    auto c = classify(ok(R"({"error":"Invalid API key"})"), serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::MissingMetadata);
    EXPECT_EQ(c.detail, "Missing search_metadata: Invalid API key");

    auto bare = classify(ok(R"({"foo":1})"), serpApiRules());
    EXPECT_EQ(bare.detail, "Missing search_metadata");
}

TEST(ResponseClassifierTest, ReportedErrorField) {
    auto c = classify(ok(R"({"search_metadata":{"status":"Success"},"error":"quota"})"),
                      serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::ReportedError);
    EXPECT_EQ(c.detail, "API Error: quota");
}

TEST(ResponseClassifierTest, ReportedErrorStatus) {
    auto c = classify(ok(R"({"search_metadata":{"status":"error","error":"engine down"}})"),
                      serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::ReportedError);
    EXPECT_EQ(c.detail, "Search error: engine down");
}

TEST(ResponseClassifierTest, EmptyResult) {
    auto c = classify(
        ok(R"({"search_metadata":{"status":"Success"},"organic_results":[]})"),
        serpApiRules());
    EXPECT_EQ(c.kind, FailureKind::EmptyResult);
    EXPECT_EQ(c.detail, "No results found");
}

TEST(ResponseClassifierTest, ResultFieldPresent) {
    auto c = classify(
        ok(R"({"search_metadata":{"status":"Success"},"organic_results":[{"title":"t"}]})"),
        serpApiRules());
    EXPECT_TRUE(c.success());
}

TEST(ResponseClassifierTest, ManyTopLevelKeysCountAsResults) {
    auto c = classify(
        ok(R"({"search_metadata":{"status":"Success"},"search_parameters":{},"flights":[1]})"),
        serpApiRules());
    EXPECT_TRUE(c.success());
}

TEST(ResponseClassifierTest, JsonObjectRulesAcceptAnyObject) {
    EXPECT_TRUE(classify(ok(R"({"ip":"1.2.3.4"})"), jsonObjectRules()).success());
    EXPECT_TRUE(classify(ok("{}"), jsonObjectRules()).success());
}

TEST(ResponseClassifierTest, NonJsonRulesOnlyCheckStatus) {
    ValidationRules rules;
    rules.requireJsonObject = false;
    EXPECT_TRUE(classify(ok("plain text"), rules).success());
}

TEST(ResponseClassifierTest, Deterministic) {
    const auto resp = ok(R"({"search_metadata":{"status":"error","error":"x"},"error":"y"})");
    const auto first = classify(resp, serpApiRules());
    for (int i = 0; i < 5; ++i) {
        auto again = classify(resp, serpApiRules());
        EXPECT_EQ(again.kind, first.kind);
        EXPECT_EQ(again.detail, first.detail);
    }
    // The top-level error field is checked before the metadata status.
    EXPECT_EQ(first.detail, "API Error: y");
}
