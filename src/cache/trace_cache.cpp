#include "cache/trace_cache.hpp"

#include <algorithm>
#include <functional>

namespace haproxyotel {

// ============================================================================
// ShardedTraceCache
// ============================================================================

ShardedTraceCache::ShardedTraceCache()
    : ShardedTraceCache(Config{}) {}

ShardedTraceCache::ShardedTraceCache(const Config& config)
    : config_(config) {
    const size_t num_shards = std::max(config_.num_shards, size_t{1});
    const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(per_shard));
    }
}

size_t ShardedTraceCache::select_shard(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

std::optional<TraceContext> ShardedTraceCache::get(const std::string& key) {
    auto result = shards_[select_shard(key)]->get(key);
    if (result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void ShardedTraceCache::store(const std::string& key, TraceContext context) {
    shards_[select_shard(key)]->put(key, std::move(context));
}

std::optional<TraceContext> ShardedTraceCache::remove(const std::string& key) {
    return shards_[select_shard(key)]->take(key);
}

size_t ShardedTraceCache::size() const {
    size_t entries = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
    }
    return entries;
}

ShardedTraceCache::Stats ShardedTraceCache::get_stats() const {
    size_t entries = 0;
    uint64_t evictions = 0;
    for (const auto& shard : shards_) {
        entries += shard->size();
        evictions += shard->evictions.load(std::memory_order_relaxed);
    }
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions,
        .current_entries = entries,
    };
}

// ============================================================================
// Shard
// ============================================================================

std::optional<TraceContext> ShardedTraceCache::Shard::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    return it->second->context;
}

void ShardedTraceCache::Shard::put(const std::string& key, TraceContext context) {
    std::lock_guard lock(mutex_);

    // Overwrite in place
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->context = std::move(context);
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict LRU if at capacity
    while (map_.size() >= max_entries_ && !lru_list_.empty()) {
        auto& back = lru_list_.back();
        map_.erase(back.key);
        lru_list_.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.emplace_front(CacheEntry{key, std::move(context)});
    map_[key] = lru_list_.begin();
}

std::optional<TraceContext> ShardedTraceCache::Shard::take(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) return std::nullopt;

    auto context = std::move(it->second->context);
    lru_list_.erase(it->second);
    map_.erase(it);
    return context;
}

size_t ShardedTraceCache::Shard::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

// ============================================================================
// Process-wide instance
// ============================================================================

ShardedTraceCache& global_trace_cache() {
    static ShardedTraceCache cache;
    return cache;
}

} // namespace haproxyotel
