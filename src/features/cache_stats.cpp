#include "cache_stats.hpp"

#include "../core/vector_cache_store.hpp"

HitRateTracker::HitRateTracker(size_t window) : window_(window == 0 ? 1 : window) {}

void HitRateTracker::record(bool hit) {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_.push_back(hit);
    if (hit) {
        ++recent_hits_;
        ++hits_;
    } else {
        ++misses_;
    }
    if (recent_.size() > window_) {
        if (recent_.front()) --recent_hits_;
        recent_.pop_front();
    }
}

double HitRateTracker::hitRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recent_.empty()) return 1.0;
    return static_cast<double>(recent_hits_) / static_cast<double>(recent_.size());
}

uint64_t HitRateTracker::totalHits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t HitRateTracker::totalMisses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

CacheStats computeStats(const VectorCacheStore& store, const HitRateTracker& tracker) {
    CacheStats stats;

    uint64_t total_accesses = 0;
    std::vector<uint64_t> counts;
    store.forEachEntry([&](const VectorCacheStore::ConstEntryPtr& entry) {
        counts.push_back(entry->accessCount());
        total_accesses += entry->accessCount();
        stats.total_bytes += entry->sizeBytes();
    });

    stats.entry_count = counts.size();
    stats.memory_kb = static_cast<double>(stats.total_bytes) / 1024.0;
    stats.memory_limit_kb = store.config().max_memory_kb;
    stats.memory_utilization = stats.memory_limit_kb > 0
        ? stats.memory_kb / static_cast<double>(stats.memory_limit_kb) * 100.0
        : 0.0;
    stats.dimensions = store.dimensions();

    stats.hit_rate = tracker.hitRate();
    stats.hits = tracker.totalHits();
    stats.misses = tracker.totalMisses();
    stats.searches_performed = stats.hits + stats.misses;

    stats.evictions_performed = store.evictionsPerformed();
    stats.last_eviction = store.lastEviction();

    if (!counts.empty()) {
        stats.average_access_count = static_cast<double>(total_accesses) / counts.size();
        for (uint64_t c : counts) {
            if (static_cast<double>(c) > stats.average_access_count) ++stats.hot_entries;
            if (c == 0) ++stats.cold_entries;
        }
    }
    return stats;
}

void to_json(json& j, const CacheStats& s) {
    j = json{
        {"entry_count", s.entry_count},
        {"total_bytes", s.total_bytes},
        {"memory_kb", s.memory_kb},
        {"memory_limit_kb", s.memory_limit_kb},
        {"memory_utilization", s.memory_utilization},
        {"dimensions", s.dimensions},
        {"hit_rate", s.hit_rate},
        {"searches_performed", s.searches_performed},
        {"hits", s.hits},
        {"misses", s.misses},
        {"evictions_performed", s.evictions_performed},
        {"average_access_count", s.average_access_count},
        {"hot_entries", s.hot_entries},
        {"cold_entries", s.cold_entries},
        {"state", s.state}
    };
    if (s.last_eviction) {
        j["last_eviction_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            s.last_eviction->time_since_epoch()).count();
    } else {
        j["last_eviction_ms"] = nullptr;
    }
}
