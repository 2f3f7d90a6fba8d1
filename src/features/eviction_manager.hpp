// src/features/eviction_manager.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../core/cache_config.hpp"
#include "../core/vector_entry.hpp"
#include "../utils/random_generator.hpp"

class VectorCacheStore;

struct EvictionResult {
    size_t evicted_count{0};
    size_t candidates_found{0};
    size_t bytes_freed{0};
    std::vector<std::string> evicted_ids;

    // True when the candidates ran out before the target was reached.
    bool under_delivered{false};
};

inline void to_json(json& j, const EvictionResult& r) {
    j = json{
        {"evicted_count", r.evicted_count},
        {"candidates_found", r.candidates_found},
        {"bytes_freed", r.bytes_freed},
        {"under_delivered", r.under_delivered}
    };
}

/**
 * Picks and removes entries in strategy order until usage reaches a target.
 *
 *  lru      - oldest lastAccessedAt first
 *  lfu      - lowest accessCount first, then oldest lastAccessedAt
 *  random   - uniform shuffle
 *  priority - lowest priority first, then lru order
 *
 * Non-random orders end with ascending id so they are fully deterministic.
 */
class EvictionManager {
public:
    struct Request {
        EvictionStrategy strategy = EvictionStrategy::LRU;
        size_t current_bytes = 0;
        size_t target_bytes = 0;
        size_t target_count = std::numeric_limits<size_t>::max();
        size_t max_evictions = std::numeric_limits<size_t>::max();
        const std::string* pinned_id = nullptr;  // never evicted
    };

    // seed 0 draws one from std::random_device.
    explicit EvictionManager(uint64_t seed = 0);

    EvictionManager(const EvictionManager&) = delete;
    EvictionManager& operator=(const EvictionManager&) = delete;

    // Takes the store's exclusive lock.
    EvictionResult selectAndEvict(VectorCacheStore& store,
                                  EvictionStrategy strategy,
                                  size_t current_bytes,
                                  size_t target_bytes);

    // Ids in the order they would be evicted; does not mutate.
    std::vector<std::string> evictionOrder(const VectorCacheStore& store, EvictionStrategy strategy);

private:
    friend class MemoryBudgetManager;

    using EntryPtr = std::shared_ptr<VectorEntry>;

    // Caller holds the store's exclusive lock.
    EvictionResult evictLocked(VectorCacheStore& store, const Request& request);
    std::vector<EntryPtr> rankCandidatesLocked(const VectorCacheStore& store,
                                               EvictionStrategy strategy,
                                               const std::string* pinned_id);

    std::mutex rng_mutex_;
    RandomGenerator rng_;
};
