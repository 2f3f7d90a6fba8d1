// test/test_helpers.hpp
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "algorithms/similarity_search_engine.hpp"
#include "api/external_interfaces.hpp"
#include "core/cache_errors.hpp"
#include "core/vector_cache_store.hpp"
#include "core/vector_entry.hpp"

inline VectorEntry makeEntry(const std::string& id, const Vector& v,
                             const std::string& category = "general",
                             const std::string& source_type = "faq",
                             int priority = 0) {
    EntryMetadata meta;
    meta.title = "Title " + id;
    meta.content = "Content for " + id;
    meta.category = category;
    meta.source_type = source_type;
    meta.priority = priority;
    return VectorEntry(id, v, meta);
}

// What the store will charge for `entry`.
inline size_t chargedBytes(VectorEntry entry) {
    if (entry.contentHash().empty()) entry.setContentHash(entry.computeContentHash());
    return entry.estimateSizeBytes();
}

// Deterministic wall clock for stores; advance() moves it forward.
class FakeClock {
public:
    FakeClock() : now_(std::make_shared<VectorEntry::TimePoint>(
                      VectorEntry::TimePoint(std::chrono::hours(1000)))) {}

    VectorCacheStore::TimeSource source() const {
        auto now = now_;
        return [now] { return *now; };
    }
    void advance(std::chrono::milliseconds d) { *now_ += d; }
    VectorEntry::TimePoint now() const { return *now_; }

private:
    std::shared_ptr<VectorEntry::TimePoint> now_;
};

// Reaches into store internals to simulate corruption.
class VectorCacheStoreTestPeer {
public:
    static void corruptHash(VectorCacheStore& store, const std::string& id) {
        std::unique_lock<std::shared_mutex> lock(store.mutex_);
        (*store.index_.at(id))->setContentHash(std::string(64, '0'));
    }

    // Swaps in an entry that bypassed validation; byte accounting stays consistent.
    static void replaceUnchecked(VectorCacheStore& store, const std::string& id, VectorEntry replacement) {
        std::unique_lock<std::shared_mutex> lock(store.mutex_);
        auto& slot = *store.index_.at(id);
        replacement.setContentHash(replacement.computeContentHash());
        auto fresh = std::make_shared<VectorEntry>(replacement);
        store.total_bytes_ -= slot->sizeBytes();
        store.total_bytes_ += fresh->sizeBytes();
        slot = fresh;
    }

    static void skewAccounting(VectorCacheStore& store, size_t extra_bytes) {
        std::unique_lock<std::shared_mutex> lock(store.mutex_);
        store.total_bytes_ += extra_bytes;
    }
};

// In-memory repository with failure injection.
class StubRepository : public VectorRepository {
public:
    void set(const ScopeKey& scope, std::vector<VectorEntry> entries) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[scope] = std::move(entries);
    }

    std::vector<VectorEntry> loadAll(const ScopeKey& scope, const LoadControl& control) override {
        std::function<void(const LoadControl&)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++load_all_calls;
            if (fail_next_loads > 0) {
                --fail_next_loads;
                throw std::runtime_error("repository unavailable");
            }
            hook = on_load;
        }
        if (hook) hook(control);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(scope);
        return it == data_.end() ? std::vector<VectorEntry>{} : it->second;
    }

    std::vector<VectorEntry> loadByIds(const ScopeKey& scope,
                                       const std::vector<std::string>& ids,
                                       const LoadControl& control) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++load_by_ids_calls;
        }
        return VectorRepository::loadByIds(scope, ids, control);
    }

    int load_all_calls = 0;
    int load_by_ids_calls = 0;
    int fail_next_loads = 0;
    std::function<void(const LoadControl&)> on_load;  // runs inside loadAll, without the stub's lock

private:
    std::mutex mutex_;
    std::map<ScopeKey, std::vector<VectorEntry>> data_;
};

class StubEmbeddingProvider : public EmbeddingProvider {
public:
    void set(const std::string& text, Vector v) { vectors_[text] = std::move(v); }

    Vector embed(const std::string& text) override {
        auto it = vectors_.find(text);
        if (it == vectors_.end()) throw EmbeddingGenerationError("no embedding for '" + text + "'");
        return it->second;
    }

private:
    std::map<std::string, Vector> vectors_;
};

inline std::vector<std::string> idsOf(const std::vector<SearchResult>& results) {
    std::vector<std::string> ids;
    for (const auto& r : results) ids.push_back(r.entry->id());
    return ids;
}
