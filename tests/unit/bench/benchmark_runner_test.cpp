#include <gtest/gtest.h>
#include <latbench/bench/benchmark_runner.h>

#include <atomic>
#include <memory>

#include "support/bench_fakes.h"

using namespace std::chrono_literals;
using namespace latbench;
using namespace latbench::bench;
using namespace latbench::test_support;

namespace {

RunParameters quickParams() {
    RunParameters p;
    p.category = "unit";
    p.concurrency = 4;
    p.requestsPerTarget = 3;
    p.batchSize = 2;
    p.progressInterval = 0ms;
    return p;
}

std::shared_ptr<ScriptedTransport> mixedTransport() {
    return std::make_shared<ScriptedTransport>([](const RequestSpec& spec) {
        SessionScript s;
        if (spec.url.find("/bad") != std::string::npos) {
            s.response = jsonResponse(503, "unavailable");
        } else {
            s.response = jsonResponse(200, R"({"ip":"192.0.2.1","country":"US"})");
        }
        s.performDelay = 1ms;
        return s;
    });
}

} // namespace

TEST(BenchmarkRunnerValidationTest, RejectsBadParametersBeforeAnyRequest) {
    auto transport = mixedTransport();
    BenchmarkRunner runner(transport);
    CollectingSummaryWriter summary;

    auto params = quickParams();
    params.concurrency = 0;
    auto r = runner.run({makeTarget("good", 1)}, params, nullptr, summary);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(transport->opened(), 0u);
    EXPECT_EQ(summary.calls, 0);
}

TEST(BenchmarkRunnerValidationTest, RejectsEachInvalidField) {
    const std::vector<TargetDescriptor> targets{makeTarget("a", 1)};

    auto negativeRate = quickParams();
    negativeRate.ratePerSecond = -1.0;
    EXPECT_FALSE(validateRunParameters(negativeRate, targets));

    auto tinyRate = quickParams();
    tinyRate.ratePerSecond = 1e-10;
    auto tinyRateResult = validateRunParameters(tinyRate, targets);
    ASSERT_FALSE(tinyRateResult);
    EXPECT_EQ(tinyRateResult.error().code, ErrorCode::ConfigurationError);
    tinyRate.ratePerSecond = 1e-9;
    EXPECT_TRUE(validateRunParameters(tinyRate, targets));

    auto zeroTimeout = quickParams();
    zeroTimeout.readTimeout = 0ms;
    EXPECT_FALSE(validateRunParameters(zeroTimeout, targets));

    auto zeroBatch = quickParams();
    zeroBatch.batchSize = 0;
    EXPECT_FALSE(validateRunParameters(zeroBatch, targets));
    zeroBatch.detailedLogging = false;
    EXPECT_TRUE(validateRunParameters(zeroBatch, targets));

    EXPECT_FALSE(validateRunParameters(quickParams(), {}));
    EXPECT_FALSE(validateRunParameters(quickParams(), {makeTarget("a", 1), makeTarget("a", 2)}));

    auto noEndpoint = makeTarget("x", 1);
    noEndpoint.endpoint.clear();
    EXPECT_FALSE(validateRunParameters(quickParams(), {noEndpoint}));

    EXPECT_TRUE(validateRunParameters(quickParams(), targets));
}

TEST(BenchmarkRunnerTest, EndToEndWithScriptedTransport) {
    auto transport = mixedTransport();
    BenchmarkRunner runner(transport);
    CollectingDetailWriter details;
    CollectingSummaryWriter summary;

    auto good = makeTarget("good", 3);
    good.extractFields = {"ip", "country"};
    auto bad = makeTarget("bad", 3);

    auto r = runner.run({good, bad}, quickParams(), &details, summary);
    ASSERT_TRUE(r) << r.error().message;
    const auto& report = r.value();

    EXPECT_EQ(report.totalRequests, 6u);
    EXPECT_EQ(report.outcomes, 6u);
    EXPECT_EQ(report.cleanupFailures, 0u);
    EXPECT_LE(report.peakInFlight, 4u);
    EXPECT_EQ(transport->opened(), 6u);
    EXPECT_EQ(transport->closed(), 6u);

    ASSERT_EQ(report.summaries.size(), 2u);
    EXPECT_EQ(report.summaries[0].targetId, "good");
    EXPECT_EQ(report.summaries[0].successCount, 3u);
    EXPECT_EQ(report.summaries[0].category, "unit");
    EXPECT_EQ(report.summaries[1].targetId, "bad");
    EXPECT_EQ(report.summaries[1].successCount, 0u);
    EXPECT_EQ(report.summaries[1].failuresByReason.at("http:503"), 3u);

    EXPECT_EQ(summary.calls, 1);
    EXPECT_EQ(summary.rows.size(), 2u);
    EXPECT_EQ(details.rows().size(), 6u);
    for (const auto& row : details.rows()) {
        if (row.targetId == "good") {
            EXPECT_EQ(row.extracted.at("country"), "US");
        }
    }
}

TEST(BenchmarkRunnerTest, ConnectionsAreNeverReused) {
    auto transport = mixedTransport();
    BenchmarkRunner runner(transport);
    CollectingSummaryWriter summary;

    auto r = runner.run({makeTarget("good", 5)}, quickParams(), nullptr, summary);
    ASSERT_TRUE(r);
    for (const auto& p : transport->policies()) {
        EXPECT_FALSE(p.reuseConnections);
    }
    EXPECT_EQ(transport->opened(), transport->closed());
}

TEST(BenchmarkRunnerTest, ZeroRequestTargetGetsEmptyRow) {
    auto transport = mixedTransport();
    BenchmarkRunner runner(transport);
    CollectingSummaryWriter summary;

    auto r = runner.run({makeTarget("idle", 0), makeTarget("good", 2)}, quickParams(), nullptr,
                        summary);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().summaries.size(), 2u);
    const auto& idle = r.value().summaries[0];
    EXPECT_EQ(idle.targetId, "idle");
    EXPECT_EQ(idle.totalRequests, 0u);
    EXPECT_FALSE(idle.successRatePercent.has_value());
}

TEST(BenchmarkRunnerTest, SummaryWriterFailurePropagates) {
    auto transport = mixedTransport();
    BenchmarkRunner runner(transport);
    CollectingSummaryWriter summary;
    summary.failWith = "read-only filesystem";

    auto r = runner.run({makeTarget("good", 1)}, quickParams(), nullptr, summary);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::WriteError);
}

TEST(BenchmarkRunnerTest, ReportsProgress) {
    auto transport = std::make_shared<ScriptedTransport>([](const RequestSpec&) {
        SessionScript s;
        s.response = jsonResponse(200, "{}");
        s.performDelay = 10ms;
        return s;
    });
    BenchmarkRunner runner(transport);
    CollectingSummaryWriter summary;

    auto params = quickParams();
    params.concurrency = 1;
    params.progressInterval = 5ms;

    std::atomic<int> reports{0};
    std::atomic<std::size_t> lastTotal{0};
    auto r = runner.run({makeTarget("good", 10)}, params, nullptr, summary,
                        [&](const ProgressSnapshot& s) {
                            reports.fetch_add(1);
                            lastTotal = s.total;
                        });
    ASSERT_TRUE(r);
    EXPECT_GT(reports.load(), 0);
    EXPECT_EQ(lastTotal.load(), 10u);
}

TEST(BenchmarkRunnerTest, MissingTransportIsNotInitialized) {
    BenchmarkRunner runner(nullptr);
    CollectingSummaryWriter summary;
    auto r = runner.run({makeTarget("good", 1)}, quickParams(), nullptr, summary);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}
