#pragma once

#include <opentelemetry/context/context.h>

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace haproxyotel {

/// In-flight tracing context: the active span plus its ancestry
using TraceContext = opentelemetry::context::Context;

/**
 * @brief Abstract trace-id -> context store
 *
 * Each operation is individually atomic. get() is non-destructive,
 * store() is last-write-wins, remove() hands the entry to exactly one
 * caller and returns nullopt afterwards.
 */
class ITraceCache {
public:
    virtual ~ITraceCache() = default;

    [[nodiscard]] virtual std::optional<TraceContext> get(const std::string& key) = 0;
    virtual void store(const std::string& key, TraceContext context) = 0;
    [[nodiscard]] virtual std::optional<TraceContext> remove(const std::string& key) = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

/**
 * @brief Sharded LRU implementation of ITraceCache
 *
 * Keys hash to one of N independently locked shards, so requests with
 * different trace ids rarely contend. Entries are normally removed when
 * the server span completes; LRU eviction only reclaims entries from
 * requests that never reached their terminal phase.
 */
class ShardedTraceCache : public ITraceCache {
public:
    struct Config {
        size_t max_entries = 1'000'000;
        size_t num_shards = 16;
    };

    ShardedTraceCache();
    explicit ShardedTraceCache(const Config& config);

    [[nodiscard]] std::optional<TraceContext> get(const std::string& key) override;
    void store(const std::string& key, TraceContext context) override;
    [[nodiscard]] std::optional<TraceContext> remove(const std::string& key) override;

    [[nodiscard]] size_t size() const override;

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        size_t current_entries;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::string key;
        TraceContext context;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<TraceContext> get(const std::string& key);
        void put(const std::string& key, TraceContext context);
        std::optional<TraceContext> take(const std::string& key);
        size_t size() const;

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> map_;
    };

    size_t select_shard(const std::string& key) const;

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

/// Process-wide cache, created on first use and kept for the process lifetime
[[nodiscard]] ShardedTraceCache& global_trace_cache();

} // namespace haproxyotel
