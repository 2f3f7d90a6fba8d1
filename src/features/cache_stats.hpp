#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "../core/cache_config.hpp"
#include "../core/vector_entry.hpp"

class VectorCacheStore;

// Hit rate over the last `window` searches. A search that returns at least
// one result is a hit.
class HitRateTracker {
public:
    explicit HitRateTracker(size_t window = 100);

    void record(bool hit);

    // 1.0 before any search has been recorded.
    double hitRate() const;
    uint64_t totalHits() const;
    uint64_t totalMisses() const;

private:
    mutable std::mutex mutex_;
    size_t window_;
    std::deque<bool> recent_;
    size_t recent_hits_{0};
    uint64_t hits_{0};
    uint64_t misses_{0};
};

// Derived on demand, never stored.
struct CacheStats {
    size_t entry_count{0};
    size_t total_bytes{0};
    double memory_kb{0.0};
    size_t memory_limit_kb{0};
    double memory_utilization{0.0};  // percent of limit
    size_t dimensions{0};

    double hit_rate{1.0};
    uint64_t searches_performed{0};
    uint64_t hits{0};
    uint64_t misses{0};

    uint64_t evictions_performed{0};
    std::optional<VectorEntry::TimePoint> last_eviction;

    double average_access_count{0.0};
    size_t hot_entries{0};   // accessed more than average
    size_t cold_entries{0};  // never accessed

    std::string state;
};

CacheStats computeStats(const VectorCacheStore& store, const HitRateTracker& tracker);

void to_json(json& j, const CacheStats& s);
