#include "eviction_manager.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <random>
#include <shared_mutex>

#include "../core/vector_cache_store.hpp"

namespace {

unsigned int resolveSeed(uint64_t seed) {
    if (seed == 0) return std::random_device{}();
    return static_cast<unsigned int>(seed ^ (seed >> 32));
}

bool lruBefore(const VectorEntry& a, const VectorEntry& b) {
    if (a.lastAccessedAt() != b.lastAccessedAt()) return a.lastAccessedAt() < b.lastAccessedAt();
    return a.id() < b.id();
}

}  // namespace

EvictionManager::EvictionManager(uint64_t seed) : rng_(resolveSeed(seed)) {}

// -------------------- ranking --------------------

std::vector<EvictionManager::EntryPtr>
EvictionManager::rankCandidatesLocked(const VectorCacheStore& store,
                                      EvictionStrategy strategy,
                                      const std::string* pinned_id) {
    std::vector<EntryPtr> candidates;
    candidates.reserve(store.entries_.size());
    for (const auto& entry : store.entries_) {
        if (pinned_id && entry->id() == *pinned_id) continue;
        candidates.push_back(entry);
    }

    switch (strategy) {
        case EvictionStrategy::LRU:
            std::sort(candidates.begin(), candidates.end(),
                      [](const EntryPtr& a, const EntryPtr& b) { return lruBefore(*a, *b); });
            break;

        case EvictionStrategy::LFU:
            std::sort(candidates.begin(), candidates.end(),
                      [](const EntryPtr& a, const EntryPtr& b) {
                          if (a->accessCount() != b->accessCount()) {
                              return a->accessCount() < b->accessCount();
                          }
                          return lruBefore(*a, *b);
                      });
            break;

        case EvictionStrategy::PRIORITY:
            std::sort(candidates.begin(), candidates.end(),
                      [](const EntryPtr& a, const EntryPtr& b) {
                          if (a->priority() != b->priority()) return a->priority() < b->priority();
                          return lruBefore(*a, *b);
                      });
            break;

        case EvictionStrategy::RANDOM: {
            std::vector<size_t> order;
            {
                std::lock_guard<std::mutex> lock(rng_mutex_);
                order = rng_.permutation(candidates.size());
            }
            std::vector<EntryPtr> shuffled;
            shuffled.reserve(candidates.size());
            for (size_t idx : order) shuffled.push_back(candidates[idx]);
            candidates.swap(shuffled);
            break;
        }
    }
    return candidates;
}

std::vector<std::string> EvictionManager::evictionOrder(const VectorCacheStore& store,
                                                        EvictionStrategy strategy) {
    std::shared_lock<std::shared_mutex> lock(store.mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : rankCandidatesLocked(store, strategy, nullptr)) {
        ids.push_back(entry->id());
    }
    return ids;
}

// -------------------- eviction --------------------

EvictionResult EvictionManager::selectAndEvict(VectorCacheStore& store,
                                               EvictionStrategy strategy,
                                               size_t current_bytes,
                                               size_t target_bytes) {
    std::unique_lock<std::shared_mutex> lock(store.mutex_);
    Request request;
    request.strategy = strategy;
    request.current_bytes = current_bytes;
    request.target_bytes = target_bytes;
    return evictLocked(store, request);
}

EvictionResult EvictionManager::evictLocked(VectorCacheStore& store, const Request& request) {
    EvictionResult result;

    size_t current = request.current_bytes;
    size_t count = store.entries_.size();
    auto satisfied = [&]() {
        return current <= request.target_bytes && count <= request.target_count;
    };
    if (satisfied()) return result;

    auto candidates = rankCandidatesLocked(store, request.strategy, request.pinned_id);
    result.candidates_found = candidates.size();

    for (const auto& victim : candidates) {
        if (satisfied() || result.evicted_count >= request.max_evictions) break;

        const size_t freed = victim->sizeBytes();
        if (!store.eraseLocked(victim->id())) continue;

        current = freed > current ? 0 : current - freed;
        --count;
        result.bytes_freed += freed;
        result.evicted_count++;
        result.evicted_ids.push_back(victim->id());
    }

    result.under_delivered = !satisfied() && result.evicted_count < request.max_evictions;
    store.recordEvictionsLocked(result.evicted_count);

    if (result.under_delivered) {
        std::cerr << "[Eviction] Under-delivered: evicted " << result.evicted_count << " of "
                  << result.candidates_found << " candidates, usage still " << current
                  << " bytes (target " << request.target_bytes << ")" << std::endl;
    }
    return result;
}
