// src/features/memory_budget_manager.hpp
#pragma once

#include <cstddef>
#include <string>

#include "../core/cache_config.hpp"
#include "eviction_manager.hpp"

class VectorCacheStore;

struct EnforcementResult {
    size_t evicted{0};
    size_t bytes_before{0};
    size_t bytes_after{0};
    size_t batches{0};
    bool   under_budget{true};
};

inline void to_json(json& j, const EnforcementResult& r) {
    j = json{
        {"evicted", r.evicted},
        {"bytes_before", r.bytes_before},
        {"bytes_after", r.bytes_after},
        {"batches", r.batches},
        {"under_budget", r.under_budget}
    };
}

/**
 * Keeps a store within its memory budget (and optional entry-count ceiling).
 *
 * Within budget: no-op. Over budget: evicts in batches down to
 * budget * headroom_factor. If the candidates run out while the store is still
 * over budget, throws MemoryManagementError; eviction cannot fix that.
 */
class MemoryBudgetManager {
public:
    explicit MemoryBudgetManager(const CacheConfig& config);

    MemoryBudgetManager(const MemoryBudgetManager&) = delete;
    MemoryBudgetManager& operator=(const MemoryBudgetManager&) = delete;

    // Takes the store's exclusive lock.
    EnforcementResult checkAndEnforce(VectorCacheStore& store, size_t max_memory_kb);

    size_t targetBytes(size_t max_memory_kb) const;

private:
    friend class VectorCacheStore;

    // Caller holds the store's exclusive lock. pinned_id is exempt from eviction.
    EnforcementResult enforceLocked(VectorCacheStore& store,
                                    size_t max_memory_kb,
                                    const std::string* pinned_id);

    CacheConfig config_;
    EvictionManager eviction_;
};
