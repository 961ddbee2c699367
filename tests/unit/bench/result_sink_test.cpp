#include <gtest/gtest.h>
#include <latbench/bench/result_sink.h>

#include <thread>
#include <vector>

#include "support/bench_fakes.h"

using namespace std::chrono_literals;
using namespace latbench::bench;
using latbench::TimePoint;
using latbench::test_support::CollectingDetailWriter;
using latbench::test_support::makeOutcome;

namespace {

const TimePoint t0 = TimePoint{} + std::chrono::hours(1);

} // namespace

TEST(ResultSinkTest, FlushesFullBatchesThenRemainder) {
    CollectingDetailWriter writer;
    ResultSink sink(ResultSink::Config{true, 3}, &writer);
    sink.start();
    for (int i = 0; i < 7; ++i) {
        sink.submit(makeOutcome("google", t0, 10ms, true, 10));
    }
    auto aggregates = sink.finish();

    EXPECT_EQ(writer.batchSizes(), (std::vector<std::size_t>{3, 3, 1}));
    EXPECT_EQ(writer.rows().size(), 7u);
    ASSERT_EQ(aggregates.size(), 1u);
    EXPECT_EQ(aggregates[0].total, 7u);

    auto stats = sink.getStats();
    EXPECT_EQ(stats.received, 7u);
    EXPECT_EQ(stats.processed, 7u);
    EXPECT_EQ(stats.batchesFlushed, 3u);
    EXPECT_EQ(stats.rowsFlushed, 7u);
}

TEST(ResultSinkTest, DetailedLoggingOffWritesNothing) {
    CollectingDetailWriter writer;
    ResultSink sink(ResultSink::Config{false, 2}, &writer);
    sink.start();
    for (int i = 0; i < 5; ++i) {
        sink.submit(makeOutcome("bing", t0, 10ms, i % 2 == 0));
    }
    auto aggregates = sink.finish();

    EXPECT_TRUE(writer.batchSizes().empty());
    ASSERT_EQ(aggregates.size(), 1u);
    EXPECT_EQ(aggregates[0].total, 5u);
    EXPECT_EQ(aggregates[0].successes, 3u);
}

TEST(ResultSinkTest, FlushErrorsAreCountedNotFatal) {
    CollectingDetailWriter writer;
    writer.failWith("disk full");
    ResultSink sink(ResultSink::Config{true, 2}, &writer);
    sink.start();
    for (int i = 0; i < 4; ++i) {
        sink.submit(makeOutcome("yahoo", t0, 10ms, true));
    }
    auto aggregates = sink.finish();

    ASSERT_EQ(aggregates.size(), 1u);
    EXPECT_EQ(aggregates[0].total, 4u);
    auto stats = sink.getStats();
    EXPECT_EQ(stats.flushErrors, 2u);
    EXPECT_EQ(stats.batchesFlushed, 0u);
}

TEST(ResultSinkTest, AggregatesFollowFirstSeenOrder) {
    ResultSink sink(ResultSink::Config{false, 10}, nullptr);
    sink.start();
    sink.submit(makeOutcome("zeta", t0, 10ms, true));
    sink.submit(makeOutcome("alpha", t0, 10ms, true));
    sink.submit(makeOutcome("zeta", t0, 10ms, false));
    auto aggregates = sink.finish();

    ASSERT_EQ(aggregates.size(), 2u);
    EXPECT_EQ(aggregates[0].targetId, "zeta");
    EXPECT_EQ(aggregates[0].total, 2u);
    EXPECT_EQ(aggregates[1].targetId, "alpha");
}

TEST(ResultSinkTest, ConcurrentSubmittersLoseNothing) {
    CollectingDetailWriter writer;
    ResultSink sink(ResultSink::Config{true, 16}, &writer);
    sink.start();

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&sink, t]() {
            for (int i = 0; i < 250; ++i) {
                sink.submit(makeOutcome(t % 2 ? "odd" : "even", t0, 1ms, i % 5 != 0));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    auto aggregates = sink.finish();

    std::uint64_t total = 0;
    std::uint64_t successes = 0;
    for (const auto& a : aggregates) {
        total += a.total;
        successes += a.successes;
    }
    EXPECT_EQ(total, 2000u);
    EXPECT_EQ(successes, 1600u);
    EXPECT_EQ(writer.rows().size(), 2000u);
    EXPECT_EQ(sink.processed(), 2000u);
}

TEST(ResultSinkTest, FinishWithoutStartDrainsInline) {
    CollectingDetailWriter writer;
    ResultSink sink(ResultSink::Config{true, 100}, &writer);
    sink.submit(makeOutcome("inline", t0, 5ms, true));
    auto aggregates = sink.finish();
    ASSERT_EQ(aggregates.size(), 1u);
    EXPECT_EQ(writer.batchSizes(), (std::vector<std::size_t>{1}));
}

TEST(ResultSinkTest, CountsCleanupFailures) {
    ResultSink sink(ResultSink::Config{false, 10}, nullptr);
    sink.start();
    auto o = makeOutcome("leaky", t0, 5ms, true);
    o.cleanup = CleanupStatus::Failed;
    sink.submit(o);
    sink.submit(makeOutcome("leaky", t0, 5ms, true));
    (void)sink.finish();
    EXPECT_EQ(sink.getStats().cleanupFailures, 1u);
}
