#include "memory_budget_manager.hpp"

#include <iostream>
#include <limits>
#include <mutex>
#include <shared_mutex>

#include "../core/cache_errors.hpp"
#include "../core/vector_cache_store.hpp"

MemoryBudgetManager::MemoryBudgetManager(const CacheConfig& config)
    : config_(config), eviction_(config.random_seed) {}

size_t MemoryBudgetManager::targetBytes(size_t max_memory_kb) const {
    return static_cast<size_t>(static_cast<double>(max_memory_kb) * 1024.0 * config_.headroom_factor);
}

EnforcementResult MemoryBudgetManager::checkAndEnforce(VectorCacheStore& store, size_t max_memory_kb) {
    std::unique_lock<std::shared_mutex> lock(store.mutex_);
    return enforceLocked(store, max_memory_kb, nullptr);
}

EnforcementResult MemoryBudgetManager::enforceLocked(VectorCacheStore& store,
                                                     size_t max_memory_kb,
                                                     const std::string* pinned_id) {
    const size_t budget = max_memory_kb * 1024;
    const size_t max_count = config_.max_vectors == 0 ? std::numeric_limits<size_t>::max()
                                                      : config_.max_vectors;

    EnforcementResult result;
    result.bytes_before = store.total_bytes_;
    result.bytes_after = store.total_bytes_;

    const bool over_bytes = store.total_bytes_ > budget;
    const bool over_count = store.entries_.size() > max_count;
    if (!over_bytes && !over_count) return result;

    EvictionManager::Request request;
    request.strategy = config_.eviction_strategy;
    // A count-only overflow must not also trim bytes down to the headroom target.
    request.target_bytes = over_bytes ? targetBytes(max_memory_kb) : store.total_bytes_;
    request.target_count = max_count;
    request.max_evictions = config_.eviction_batch_size;
    request.pinned_id = pinned_id;

    if (config_.verbose_logging) {
        std::cout << "[VectorCache] Budget exceeded: " << store.total_bytes_ << " bytes / "
                  << store.entries_.size() << " entries (limit " << budget << " bytes / "
                  << config_.max_vectors << " entries)" << std::endl;
    }

    while (true) {
        request.current_bytes = store.total_bytes_;
        EvictionResult batch = eviction_.evictLocked(store, request);
        result.batches++;
        result.evicted += batch.evicted_count;

        if (batch.evicted_count == 0) break;
        if (store.total_bytes_ <= request.target_bytes && store.entries_.size() <= max_count) break;
    }

    result.bytes_after = store.total_bytes_;
    result.under_budget = store.total_bytes_ <= budget && store.entries_.size() <= max_count;

    if (result.evicted > 0) {
        std::cout << "[Eviction] Evicted " << result.evicted << " entries ("
                  << to_string(config_.eviction_strategy) << ") in " << result.batches
                  << " batch(es): " << result.bytes_before << " -> " << result.bytes_after
                  << " bytes" << std::endl;
    }

    if (!result.under_budget) {
        throw MemoryManagementError("Eviction could not bring usage under budget: " +
                                    std::to_string(store.total_bytes_) + " bytes, " +
                                    std::to_string(store.entries_.size()) +
                                    " entries remain (budget " + std::to_string(budget) +
                                    " bytes)");
    }
    return result;
}
