#include <catch2/catch_test_macros.hpp>
#include "cache/trace_cache.hpp"

#include <opentelemetry/nostd/variant.h>

#include <atomic>
#include <format>
#include <thread>
#include <vector>

using namespace haproxyotel;

namespace {

TraceContext tagged(int64_t tag) {
    return TraceContext("tag", tag);
}

int64_t tag_of(const TraceContext& ctx) {
    return opentelemetry::nostd::get<int64_t>(ctx.GetValue("tag"));
}

} // anonymous namespace

TEST_CASE("TraceCache: store then get returns the context", "[cache]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{100, 4});
    cache.store("4bf92f3577b34da6a3ce929d0e0e4736", tagged(1));

    auto ctx = cache.get("4bf92f3577b34da6a3ce929d0e0e4736");
    REQUIRE(ctx.has_value());
    CHECK(tag_of(*ctx) == 1);

    // get is non-destructive
    CHECK(cache.get("4bf92f3577b34da6a3ce929d0e0e4736").has_value());
    CHECK(cache.size() == 1);
}

TEST_CASE("TraceCache: miss returns nullopt", "[cache]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{100, 4});
    CHECK_FALSE(cache.get("absent").has_value());

    auto stats = cache.get_stats();
    CHECK(stats.misses == 1);
    CHECK(stats.hits == 0);
}

TEST_CASE("TraceCache: remove hands the entry out exactly once", "[cache]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{100, 4});
    cache.store("k", tagged(7));

    auto first = cache.remove("k");
    REQUIRE(first.has_value());
    CHECK(tag_of(*first) == 7);

    CHECK_FALSE(cache.remove("k").has_value());
    CHECK_FALSE(cache.get("k").has_value());
    CHECK(cache.size() == 0);
}

TEST_CASE("TraceCache: remove of unknown key is a no-op", "[cache]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{100, 4});
    CHECK_FALSE(cache.remove("never-stored").has_value());
}

TEST_CASE("TraceCache: store overwrites existing key", "[cache]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{100, 4});
    cache.store("k", tagged(1));
    cache.store("k", tagged(2));

    CHECK(cache.size() == 1);
    auto ctx = cache.get("k");
    REQUIRE(ctx.has_value());
    CHECK(tag_of(*ctx) == 2);
}

TEST_CASE("TraceCache: LRU eviction when full", "[cache]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{3, 1});
    cache.store("a", tagged(1));
    cache.store("b", tagged(2));
    cache.store("c", tagged(3));

    // Touch "a" so "b" becomes least recently used
    CHECK(cache.get("a").has_value());
    cache.store("d", tagged(4));

    CHECK(cache.size() == 3);
    CHECK(cache.get("a").has_value());
    CHECK_FALSE(cache.get("b").has_value());
    CHECK(cache.get("c").has_value());
    CHECK(cache.get("d").has_value());
    CHECK(cache.get_stats().evictions == 1);
}

TEST_CASE("TraceCache: default capacity is one million", "[cache]") {
    ShardedTraceCache::Config cfg;
    CHECK(cfg.max_entries == 1'000'000);
    CHECK(cfg.num_shards == 16);
}

TEST_CASE("TraceCache: global cache is a single instance", "[cache]") {
    auto& a = global_trace_cache();
    auto& b = global_trace_cache();
    CHECK(&a == &b);
}

TEST_CASE("TraceCache: concurrent requests on distinct keys", "[cache][concurrency]") {
    ShardedTraceCache cache(ShardedTraceCache::Config{100'000, 16});
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::atomic<int> round_trips{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&cache, &round_trips, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const auto key = std::format("trace-{}-{}", t, i);
                const int64_t tag = t * kPerThread + i;
                cache.store(key, tagged(tag));
                auto got = cache.get(key);
                auto taken = cache.remove(key);
                if (got && taken && tag_of(*got) == tag && tag_of(*taken) == tag) {
                    round_trips.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(round_trips.load() == kThreads * kPerThread);
    CHECK(cache.size() == 0);
}
