#include <gtest/gtest.h>
#include <latbench/bench/target.h>

#include <set>

#include "support/bench_fakes.h"

using namespace std::chrono_literals;
using namespace latbench::bench;
using latbench::test_support::makeTarget;

TEST(WorkQueueTest, ExpandsTargetByTargetInOrder) {
    auto a = makeTarget("a", 2);
    auto b = makeTarget("b", 3);
    auto items = expandWorkQueue({a, b}, 10);

    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items[0].target->id, "a");
    EXPECT_EQ(items[0].sequence, 1u);
    EXPECT_EQ(items[1].sequence, 2u);
    EXPECT_EQ(items[2].target->id, "b");
    EXPECT_EQ(items[2].sequence, 1u);
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(items[i].requestIndex, i + 1);
    }
}

TEST(WorkQueueTest, DefaultCountAppliesWithoutOverride) {
    auto t = makeTarget("a", 0);
    t.requestCount.reset();
    EXPECT_EQ(expandWorkQueue({t}, 4).size(), 4u);

    auto none = makeTarget("b", 0);
    EXPECT_TRUE(expandWorkQueue({none}, 4).empty());
}

TEST(WorkQueueTest, CacheBusterTokensAreUnique) {
    auto t = makeTarget("google", 20);
    t.query = {{"q", "test"}};
    t.cacheBusterParam = "timestamp";
    auto items = expandWorkQueue({t}, 1);

    std::set<std::string> tokens;
    for (const auto& item : items) {
        ASSERT_EQ(item.params.size(), 2u);
        EXPECT_EQ(item.params[0].name, "q");
        EXPECT_EQ(item.params[1].name, "timestamp");
        tokens.insert(item.params[1].value);
    }
    EXPECT_EQ(tokens.size(), items.size());
}

TEST(WorkQueueTest, CustomTokenSource) {
    auto t = makeTarget("x", 2);
    t.cacheBusterParam = "nonce";
    auto items = expandWorkQueue({t}, 1, [](std::size_t i) { return "n" + std::to_string(i); });
    EXPECT_EQ(items[0].params.back().value, "n1");
    EXPECT_EQ(items[1].params.back().value, "n2");
}

TEST(TargetTest, EffectivePolicyAppliesOverrides) {
    ConnectionPolicy base;
    base.connectTimeout = 10000ms;
    base.readTimeout = 20000ms;

    auto t = makeTarget("slow", 1);
    t.readTimeout = 60000ms;
    auto p = effectivePolicy(base, t);
    EXPECT_EQ(p.connectTimeout, 10000ms);
    EXPECT_EQ(p.readTimeout, 60000ms);
    EXPECT_FALSE(p.reuseConnections);
}

TEST(TargetTest, RequestSpecCarriesProxyAndHeaders) {
    auto t = makeTarget("eu", 1);
    t.proxy = "http://user:pw@gw.eu.example:9999";
    t.headers = {{"Accept", "application/json"}};
    auto items = expandWorkQueue({t}, 1);
    auto spec = toRequestSpec(items.front());
    EXPECT_EQ(spec.url, t.endpoint);
    ASSERT_TRUE(spec.proxy.has_value());
    EXPECT_EQ(*spec.proxy, "http://user:pw@gw.eu.example:9999");
    ASSERT_EQ(spec.headers.size(), 1u);
}
