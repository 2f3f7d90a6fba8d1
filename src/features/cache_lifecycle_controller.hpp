#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../algorithms/similarity_search_engine.hpp"
#include "../api/external_interfaces.hpp"
#include "../core/cache_config.hpp"
#include "../core/scope_key.hpp"
#include "../core/vector_cache_store.hpp"
#include "cache_stats.hpp"
#include "integrity_checker.hpp"

/**
 * Cache Lifecycle Controller
 *
 * Owns the serving store of one scope and moves it through
 *
 *   UNINITIALIZED -> WARMING -> READY <-> INVALIDATING
 *                       |                     |
 *                       +------> FAILED <-----+
 *
 * Warm-up loads into a fresh store and swaps it in only on success, so a
 * search never sees a partially loaded store. While INVALIDATING, searches
 * keep running against the previous store. FAILED is left only by retry().
 */
class CacheLifecycleController {
public:
    enum class State {
        UNINITIALIZED,
        WARMING,
        READY,
        INVALIDATING,
        FAILED
    };

    using StorePtr = std::shared_ptr<VectorCacheStore>;

    CacheLifecycleController(ScopeKey scope,
                             std::shared_ptr<VectorRepository> repository,
                             const CacheConfig& config = CacheConfig{});

    CacheLifecycleController(const CacheLifecycleController&) = delete;
    CacheLifecycleController& operator=(const CacheLifecycleController&) = delete;

    // Warms on first use; waits while a first warm is in flight, but not past
    // its deadline. Throws CacheInitializationError if the scope is FAILED or
    // the in-flight warm outlives warm_timeout.
    StorePtr acquireStore();

    // Knowledge-base update: rebuild from the repository.
    void invalidate();
    // Only way out of FAILED. No-op when READY.
    void retry();
    // Raises the flag the repository sees through LoadControl. Returns false if
    // no warm was running.
    bool cancelWarming();

    std::vector<SearchResult> search(const Vector& query,
                                     const SearchOptions& options = SearchOptions{});

    CacheStats getStats() const;

    // Scans the serving store. Recoverable findings are dropped and refetched,
    // unrecoverable ones trigger a full invalidation. Returns the report from
    // before remediation; throws CacheIntegrityError if the rescan is dirty.
    IntegrityReport verifyIntegrity();

    State state() const;
    std::string getStateName() const;
    std::chrono::duration<double> getTimeInCurrentState() const;
    std::string lastError() const;

    const ScopeKey& scope() const { return scope_; }
    const CacheConfig& config() const { return config_; }

    // Applied to every store this controller builds.
    void setTimeSource(VectorCacheStore::TimeSource source);

private:
    void transitionTo(State new_state);
    bool canTransition(State from, State to) const;
    static const char* getStateNameForState(State state);

    // Waits until no warm is in flight, at most until its deadline. Caller holds lock.
    void waitForWarm(std::unique_lock<std::mutex>& lock);
    // Caller holds lock and has already moved to WARMING or INVALIDATING.
    void runWarm(std::unique_lock<std::mutex>& lock);
    StorePtr loadFreshStore(const LoadControl& control);
    void checkWarmAborted(const LoadControl& control) const;

    void remediate(VectorCacheStore& store, const std::vector<std::string>& ids);

    ScopeKey scope_;
    std::shared_ptr<VectorRepository> repository_;
    CacheConfig config_;
    SimilaritySearchEngine engine_;
    HitRateTracker hit_rate_;

    mutable std::mutex mutex_;
    std::condition_variable state_changed_;
    State current_state_ = State::UNINITIALIZED;
    std::chrono::steady_clock::time_point state_entry_time_;
    LoadControl::Clock::time_point warm_deadline_;
    StorePtr store_;
    std::string error_message_;
    VectorCacheStore::TimeSource time_source_;

    std::atomic<bool> cancel_requested_{false};
};

const char* to_string(CacheLifecycleController::State state);
