#include "cache_lifecycle_controller.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "../core/cache_errors.hpp"

CacheLifecycleController::CacheLifecycleController(ScopeKey scope,
                                                   std::shared_ptr<VectorRepository> repository,
                                                   const CacheConfig& config)
    : scope_(std::move(scope)),
      repository_(std::move(repository)),
      config_(config),
      engine_(config),
      hit_rate_(config.hit_rate_window),
      state_entry_time_(std::chrono::steady_clock::now()) {
    if (!repository_) {
        throw std::invalid_argument("CacheLifecycleController requires a VectorRepository");
    }
    config_.validate();
}

const char* to_string(CacheLifecycleController::State state) {
    using S = CacheLifecycleController::State;
    switch (state) {
        case S::UNINITIALIZED: return "UNINITIALIZED";
        case S::WARMING:       return "WARMING";
        case S::READY:         return "READY";
        case S::INVALIDATING:  return "INVALIDATING";
        case S::FAILED:        return "FAILED";
        default:               return "UNKNOWN";
    }
}

const char* CacheLifecycleController::getStateNameForState(State state) {
    return to_string(state);
}

CacheLifecycleController::State CacheLifecycleController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_state_;
}

std::string CacheLifecycleController::getStateName() const {
    return getStateNameForState(state());
}

std::chrono::duration<double> CacheLifecycleController::getTimeInCurrentState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::steady_clock::now() - state_entry_time_;
}

std::string CacheLifecycleController::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

void CacheLifecycleController::setTimeSource(VectorCacheStore::TimeSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    time_source_ = source;
    if (store_) store_->setTimeSource(std::move(source));
}

// -------------------- transitions --------------------

void CacheLifecycleController::transitionTo(State new_state) {
    if (!canTransition(current_state_, new_state)) {
        std::cerr << "[Lifecycle] " << scope_.toString() << ": invalid state transition from "
                  << getStateNameForState(current_state_) << " to "
                  << getStateNameForState(new_state) << std::endl;
        return;
    }
    std::cout << "[Lifecycle] " << scope_.toString() << ": "
              << getStateNameForState(current_state_) << " -> "
              << getStateNameForState(new_state) << std::endl;
    current_state_ = new_state;
    state_entry_time_ = std::chrono::steady_clock::now();
    state_changed_.notify_all();
}

bool CacheLifecycleController::canTransition(State from, State to) const {
    switch (from) {
        case State::UNINITIALIZED: return to == State::WARMING;
        case State::WARMING:       return to == State::READY || to == State::FAILED;
        case State::READY:         return to == State::INVALIDATING;
        case State::INVALIDATING:  return to == State::READY || to == State::FAILED;
        case State::FAILED:        return to == State::WARMING;
        default:                   return false;
    }
}

void CacheLifecycleController::waitForWarm(std::unique_lock<std::mutex>& lock) {
    bool settled = state_changed_.wait_until(lock, warm_deadline_, [this] {
        return current_state_ != State::WARMING && current_state_ != State::INVALIDATING;
    });
    if (!settled) {
        throw CacheInitializationError("Scope " + scope_.toString() + " is still " +
                                       getStateNameForState(current_state_) + " after " +
                                       std::to_string(config_.warm_timeout.count()) + "ms");
    }
}

// -------------------- warm-up --------------------

void CacheLifecycleController::runWarm(std::unique_lock<std::mutex>& lock) {
    cancel_requested_.store(false);
    warm_deadline_ = LoadControl::Clock::now() + config_.warm_timeout;
    const LoadControl control(&cancel_requested_, warm_deadline_);
    lock.unlock();

    StorePtr fresh;
    std::string failure;
    try {
        fresh = loadFreshStore(control);
    } catch (const std::exception& ex) {
        failure = ex.what();
    }

    lock.lock();
    if (fresh) {
        store_ = std::move(fresh);
        error_message_.clear();
        transitionTo(State::READY);
        return;
    }

    error_message_ = failure;
    transitionTo(State::FAILED);
    std::cerr << "[Lifecycle] " << scope_.toString() << ": warm-up failed: " << failure << std::endl;
    throw CacheInitializationError("Cache warm-up failed for scope " + scope_.toString() + ": " + failure);
}

CacheLifecycleController::StorePtr CacheLifecycleController::loadFreshStore(const LoadControl& control) {
    const auto started = std::chrono::steady_clock::now();

    std::vector<VectorEntry> entries = repository_->loadAll(scope_, control);
    checkWarmAborted(control);

    auto fresh = std::make_shared<VectorCacheStore>(config_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (time_source_) fresh->setTimeSource(time_source_);
    }

    const size_t batch = std::max<size_t>(1, config_.warm_batch_size);
    size_t evicted = 0;
    for (size_t begin = 0; begin < entries.size(); begin += batch) {
        if (begin > 0) checkWarmAborted(control);
        const size_t end = std::min(begin + batch, entries.size());
        for (size_t i = begin; i < end; ++i) {
            evicted += fresh->insert(std::move(entries[i])).evicted;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    std::cout << "[Lifecycle] " << scope_.toString() << ": warmed " << fresh->size()
              << " entries (" << fresh->dimensions() << "d, " << fresh->totalBytes() / 1024
              << "KB) in " << elapsed.count() << "ms";
    if (evicted > 0) std::cout << ", " << evicted << " evicted to fit budget";
    std::cout << std::endl;
    return fresh;
}

void CacheLifecycleController::checkWarmAborted(const LoadControl& control) const {
    if (control.cancelled()) {
        throw CacheInitializationError("warm-up cancelled");
    }
    if (control.expired()) {
        throw CacheInitializationError("warm-up timed out after " +
                                       std::to_string(config_.warm_timeout.count()) + "ms");
    }
}

CacheLifecycleController::StorePtr CacheLifecycleController::acquireStore() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        switch (current_state_) {
            case State::READY:
            case State::INVALIDATING:
                return store_;
            case State::FAILED:
                throw CacheInitializationError("Scope " + scope_.toString() +
                                               " is failed: " + error_message_);
            case State::WARMING:
                waitForWarm(lock);
                break;
            case State::UNINITIALIZED:
                transitionTo(State::WARMING);
                runWarm(lock);
                break;
        }
    }
}

void CacheLifecycleController::invalidate() {
    std::unique_lock<std::mutex> lock(mutex_);
    waitForWarm(lock);
    switch (current_state_) {
        case State::UNINITIALIZED:
            transitionTo(State::WARMING);
            break;
        case State::READY:
            transitionTo(State::INVALIDATING);
            break;
        case State::FAILED:
            throw CacheInitializationError("Scope " + scope_.toString() +
                                           " is failed; retry() before invalidating");
        default:
            return;
    }
    runWarm(lock);
}

void CacheLifecycleController::retry() {
    std::unique_lock<std::mutex> lock(mutex_);
    waitForWarm(lock);
    if (current_state_ == State::READY) return;
    transitionTo(State::WARMING);
    runWarm(lock);
}

bool CacheLifecycleController::cancelWarming() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_state_ != State::WARMING && current_state_ != State::INVALIDATING) return false;
    cancel_requested_.store(true);
    return true;
}

// -------------------- reads --------------------

std::vector<SearchResult> CacheLifecycleController::search(const Vector& query,
                                                           const SearchOptions& options) {
    StorePtr store = acquireStore();
    auto results = engine_.search(*store, query, options);
    hit_rate_.record(!results.empty());
    return results;
}

CacheStats CacheLifecycleController::getStats() const {
    StorePtr store;
    State state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store = store_;
        state = current_state_;
    }

    CacheStats stats;
    if (store) {
        stats = computeStats(*store, hit_rate_);
    } else {
        stats.memory_limit_kb = config_.max_memory_kb;
        stats.dimensions = config_.dimensions;
        stats.hit_rate = hit_rate_.hitRate();
        stats.hits = hit_rate_.totalHits();
        stats.misses = hit_rate_.totalMisses();
        stats.searches_performed = stats.hits + stats.misses;
    }
    stats.state = getStateNameForState(state);
    return stats;
}

// -------------------- integrity --------------------

IntegrityReport CacheLifecycleController::verifyIntegrity() {
    StorePtr store = acquireStore();
    IntegrityChecker checker(config_);
    IntegrityReport report = checker.scan(*store);
    if (report.clean()) return report;

    if (report.hasUnrecoverable()) {
        std::cerr << "[Integrity] " << scope_.toString()
                  << ": unrecoverable findings, rebuilding scope" << std::endl;
        invalidate();
    } else {
        remediate(*store, report.recoverableIds());
    }

    IntegrityReport after = checker.scan(*acquireStore());
    if (!after.clean()) {
        throw CacheIntegrityError("Scope " + scope_.toString() + " still has " +
                                  std::to_string(after.findings.size()) +
                                  " integrity finding(s) after remediation");
    }
    return report;
}

void CacheLifecycleController::remediate(VectorCacheStore& store, const std::vector<std::string>& ids) {
    for (const auto& id : ids) store.remove(id);

    const LoadControl control(nullptr, LoadControl::Clock::now() + config_.warm_timeout);
    std::vector<VectorEntry> refetched = repository_->loadByIds(scope_, ids, control);
    if (control.expired()) {
        throw CacheIntegrityError("Refetch for scope " + scope_.toString() + " timed out after " +
                                  std::to_string(config_.warm_timeout.count()) + "ms");
    }
    size_t restored = 0;
    for (auto& entry : refetched) {
        try {
            store.insert(std::move(entry));
            ++restored;
        } catch (const CacheError& ex) {
            throw CacheIntegrityError("Refetched entry rejected for scope " + scope_.toString() +
                                      ": " + ex.what());
        }
    }
    std::cout << "[Integrity] " << scope_.toString() << ": dropped " << ids.size()
              << " entries, refetched " << restored << std::endl;
}
