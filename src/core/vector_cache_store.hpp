// Copyright [year] <Copyright Owner>
#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "cache_config.hpp"
#include "cache_errors.hpp"
#include "vector_entry.hpp"
#include "../features/memory_budget_manager.hpp"

/**
 * Vector Cache Store
 *
 * Exclusive owner of one scope's entries. Iteration follows insertion order.
 * Readers (get, forEachEntry, allEntries) share the lock; insert, remove,
 * clear and eviction take it exclusively, so a reader never sees a
 * half-applied eviction.
 */
class VectorCacheStore {
public:
    using EntryPtr = std::shared_ptr<VectorEntry>;
    using ConstEntryPtr = std::shared_ptr<const VectorEntry>;
    using TimeSource = std::function<VectorEntry::TimePoint()>;

    explicit VectorCacheStore(const CacheConfig& config = CacheConfig{});
    ~VectorCacheStore();

    VectorCacheStore(const VectorCacheStore&) = delete;
    VectorCacheStore& operator=(const VectorCacheStore&) = delete;

    // Upsert. Runs the memory budget check before returning; on any failure
    // the store is left exactly as it was.
    EnforcementResult insert(VectorEntry entry);

    bool remove(const std::string& id);

    // Does not count as an access.
    ConstEntryPtr get(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Snapshot in insertion order; iterate it as often as needed.
    std::vector<ConstEntryPtr> allEntries() const;

    // Visits entries in insertion order under the shared lock.
    void forEachEntry(const std::function<void(const ConstEntryPtr&)>& visitor) const;

    void clear();

    size_t size() const;
    size_t totalBytes() const;
    // 0 until the first insert (unless fixed by config).
    size_t dimensions() const;
    const CacheConfig& config() const { return config_; }

    uint64_t evictionsPerformed() const { return evictions_performed_.load(); }
    std::optional<VectorEntry::TimePoint> lastEviction() const;

    VectorEntry::TimePoint now() const;
    void setTimeSource(TimeSource source);

private:
    friend class MemoryBudgetManager;
    friend class EvictionManager;
    friend class IntegrityChecker;
    friend class SimilaritySearchEngine;
    friend class VectorCacheStoreTestPeer;

    using EntryList = std::list<EntryPtr>;

    // ---- callers hold mutex_ exclusively ----
    bool eraseLocked(const std::string& id);
    void recordEvictionsLocked(size_t count);
    void restoreLocked(const std::string& id, const EntryPtr& previous);

    void validateEntry(VectorEntry& entry) const;

    CacheConfig config_;
    std::unique_ptr<MemoryBudgetManager> budget_manager_;

    mutable std::shared_mutex mutex_;
    EntryList entries_;
    std::unordered_map<std::string, EntryList::iterator> index_;
    size_t total_bytes_{0};
    size_t dimensions_{0};

    std::atomic<uint64_t> evictions_performed_{0};
    std::optional<VectorEntry::TimePoint> last_eviction_;

    TimeSource time_source_;
};
