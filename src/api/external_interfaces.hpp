#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/scope_key.hpp"
#include "../core/vector.hpp"
#include "../core/vector_entry.hpp"

// Turns text into an embedding. Implementations throw EmbeddingGenerationError.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual Vector embed(const std::string& text) = 0;
};

// Cancellation flag and deadline of the warm a repository call belongs to.
// Long-running loads should poll shouldStop() and return (or throw) early;
// whatever they return after stopping is discarded.
class LoadControl {
public:
    using Clock = std::chrono::steady_clock;

    LoadControl() = default;
    LoadControl(const std::atomic<bool>* cancelled, Clock::time_point deadline)
        : cancelled_(cancelled), deadline_(deadline) {}

    bool cancelled() const { return cancelled_ && cancelled_->load(); }
    bool expired() const { return Clock::now() > deadline_; }
    bool shouldStop() const { return cancelled() || expired(); }
    Clock::time_point deadline() const { return deadline_; }

private:
    const std::atomic<bool>* cancelled_ = nullptr;
    Clock::time_point deadline_ = Clock::time_point::max();
};

// Authoritative source of a scope's entries. Errors propagate unchanged; the
// cache never retries.
class VectorRepository {
public:
    virtual ~VectorRepository() = default;

    virtual std::vector<VectorEntry> loadAll(const ScopeKey& scope, const LoadControl& control) = 0;

    // Ids that no longer exist are simply absent from the result.
    virtual std::vector<VectorEntry> loadByIds(const ScopeKey& scope,
                                               const std::vector<std::string>& ids,
                                               const LoadControl& control) {
        std::unordered_set<std::string> wanted(ids.begin(), ids.end());
        std::vector<VectorEntry> all = loadAll(scope, control);
        std::vector<VectorEntry> found;
        for (auto& entry : all) {
            if (wanted.count(entry.id())) found.push_back(std::move(entry));
        }
        return found;
    }
};
