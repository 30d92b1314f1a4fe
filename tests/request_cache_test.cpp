#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "request_cache.hpp"

using namespace cbers_tiler;
using namespace std::chrono_literals;

TEST(RequestCacheTest, ComputesOnceThenHits) {
    RequestCache<int> cache;
    int calls = 0;

    EXPECT_EQ(cache.get_or_compute("a", [&] { return ++calls; }), 1);
    EXPECT_EQ(cache.get_or_compute("a", [&] { return ++calls; }), 1);
    EXPECT_EQ(calls, 1);

    auto stats = cache.stats();
    EXPECT_EQ(stats.misses, 1U);
    EXPECT_EQ(stats.hits, 1U);
    EXPECT_EQ(stats.entries, 1U);
}

TEST(RequestCacheTest, FailuresAreNotCached) {
    RequestCache<int> cache;
    int calls = 0;

    EXPECT_THROW(cache.get_or_compute("a",
                                      [&]() -> int {
                                          ++calls;
                                          throw std::runtime_error("boom");
                                      }),
                 std::runtime_error);
    EXPECT_FALSE(cache.find("a").has_value());

    EXPECT_EQ(cache.get_or_compute("a", [&] { return ++calls; }), 2);
    EXPECT_EQ(cache.stats().entries, 1U);
}

TEST(RequestCacheTest, ConcurrentCallersShareOneComputation) {
    RequestCache<int> cache;
    std::atomic<int> calls{0};
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    auto compute = [&] {
        ++calls;
        gate.wait();
        return 42;
    };

    auto first = std::async(std::launch::async, [&] { return cache.get_or_compute("k", compute); });
    // 最初の計算が始まるまで待つ
    while (calls.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    std::vector<std::future<int>> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.push_back(
            std::async(std::launch::async, [&] { return cache.get_or_compute("k", compute); }));
    }
    // 待機側がin-flightの結果を取りに行くまで待つ
    while (cache.stats().shared < 4) {
        std::this_thread::sleep_for(1ms);
    }
    release.set_value();

    EXPECT_EQ(first.get(), 42);
    for (auto& waiter : waiters) {
        EXPECT_EQ(waiter.get(), 42);
    }
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache.stats().misses, 1U);
}

TEST(RequestCacheTest, LruEvictsLeastRecentlyUsed) {
    RequestCache<int> cache(std::make_unique<LruPolicy>(2));

    (void)cache.get_or_compute("a", [] { return 1; });
    (void)cache.get_or_compute("b", [] { return 2; });
    (void)cache.get_or_compute("a", [] { return -1; });  // aを最新にする
    (void)cache.get_or_compute("c", [] { return 3; });

    EXPECT_TRUE(cache.find("a").has_value());
    EXPECT_FALSE(cache.find("b").has_value());
    EXPECT_TRUE(cache.find("c").has_value());
    EXPECT_EQ(cache.stats().evictions, 1U);
    EXPECT_EQ(cache.stats().entries, 2U);
}

TEST(RequestCacheTest, TtlPolicyExpiresEntries) {
    TtlPolicy policy(10s);
    const auto now = EvictionPolicy::Clock::now();

    policy.on_insert("old", now);
    policy.on_insert("new", now + 8s);

    EXPECT_TRUE(policy.victims(now + 5s).empty());
    EXPECT_EQ(policy.victims(now + 10s), (std::vector<CacheKey>{"old"}));

    policy.on_erase("old");
    EXPECT_TRUE(policy.victims(now + 12s).empty());
}

TEST(RequestCacheTest, ClearDropsEntries) {
    RequestCache<int> cache;
    (void)cache.get_or_compute("a", [] { return 1; });
    cache.clear();

    EXPECT_FALSE(cache.find("a").has_value());
    EXPECT_EQ(cache.stats().entries, 0U);
}

TEST(RequestCacheTest, PolicyFromConfig) {
    EXPECT_NE(dynamic_cast<UnboundedPolicy*>(make_eviction_policy({}).get()), nullptr);
    EXPECT_NE(dynamic_cast<LruPolicy*>(make_eviction_policy({.capacity = 8}).get()), nullptr);
    EXPECT_NE(dynamic_cast<TtlPolicy*>(make_eviction_policy({.capacity = 8, .ttl = 60s}).get()),
              nullptr);
    EXPECT_THROW(LruPolicy(0), std::invalid_argument);
}

TEST(RequestCacheTest, FingerprintJoinsArguments) {
    EXPECT_EQ(fingerprint("tile", std::string("S"), 1, 2, 3), "tile|S|1|2|3");
    EXPECT_EQ(fingerprint("metadata", BandList{"5", "6"}, 2.5), "metadata|5,6|2.5");
    EXPECT_NE(fingerprint("t", BandList{"6", "5"}), fingerprint("t", BandList{"5", "6"}));
}

TEST(RequestCacheTest, FingerprintKeepsFullDoublePrecision) {
    EXPECT_NE(fingerprint("m", 2.0000001), fingerprint("m", 2.0000004));
    EXPECT_NE(fingerprint("m", 98.0, 2.0000001), fingerprint("m", 98.0, 2.0000004));
    EXPECT_EQ(fingerprint("m", 2.0, 98.0), "m|2|98");

    RequestCache<double> cache;
    int computes = 0;
    auto first = cache.get_or_compute(fingerprint("m", 2.0000001), [&] {
        ++computes;
        return 2.0000001;
    });
    auto second = cache.get_or_compute(fingerprint("m", 2.0000004), [&] {
        ++computes;
        return 2.0000004;
    });
    EXPECT_EQ(computes, 2);
    EXPECT_DOUBLE_EQ(first, 2.0000001);
    EXPECT_DOUBLE_EQ(second, 2.0000004);
}
