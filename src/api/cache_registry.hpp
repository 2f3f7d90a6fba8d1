#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/cache_config.hpp"
#include "../core/scope_key.hpp"
#include "../features/cache_lifecycle_controller.hpp"
#include "external_interfaces.hpp"

// ========================== RegistryConfig ==========================
struct RegistryConfig {
    std::chrono::milliseconds scope_ttl{30 * 60 * 1000};  // idle time before a scope is dropped
    size_t max_scopes = 20;                                // 0 = unlimited

    void validate() const;
};

void to_json(json& j, const RegistryConfig& c);
void from_json(const json& j, RegistryConfig& c);

struct HealthStatus {
    bool ready{true};  // no scope FAILED or WARMING
    size_t scope_count{0};
    size_t entry_count{0};
    double memory_kb{0.0};
    std::vector<std::string> failed_scopes;
};

void to_json(json& j, const HealthStatus& h);

/**
 * Cache Registry
 *
 * Owns one lifecycle controller per scope. Whole scopes are reclaimed when
 * idle past scope_ttl, then least recently used first beyond max_scopes; a
 * reclaimed scope is rewarmed from the repository on its next use.
 */
class CacheRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using ControllerPtr = std::shared_ptr<CacheLifecycleController>;

    explicit CacheRegistry(std::shared_ptr<VectorRepository> repository,
                           std::shared_ptr<EmbeddingProvider> embedding_provider = nullptr,
                           const CacheConfig& cache_config = CacheConfig{},
                           const RegistryConfig& registry_config = RegistryConfig{});

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    // Creates and warms the scope on first access.
    ControllerPtr get(const ScopeKey& scope);

    std::vector<SearchResult> search(const ScopeKey& scope, const Vector& query,
                                     const SearchOptions& options = SearchOptions{});
    // Embeds `text` first; provider failures surface as EmbeddingGenerationError.
    std::vector<SearchResult> searchText(const ScopeKey& scope, const std::string& text,
                                         const SearchOptions& options = SearchOptions{});

    void invalidate(const ScopeKey& scope);
    void retry(const ScopeKey& scope);
    bool evictScope(const ScopeKey& scope);
    void clear();

    CacheStats getStats(const ScopeKey& scope);
    IntegrityReport verifyIntegrity(const ScopeKey& scope);
    HealthStatus healthCheck() const;

    // Returns the number of scopes dropped.
    size_t reclaimExpired();

    size_t scopeCount() const;
    bool contains(const ScopeKey& scope) const;

    void setTimeSource(TimeSource source);

private:
    struct Slot {
        ControllerPtr controller;
        Clock::time_point last_used;
    };

    // Finds or creates the controller without warming it.
    ControllerPtr touch(const ScopeKey& scope);
    size_t reclaimLocked(Clock::time_point now, const ScopeKey* keep);
    Clock::time_point now() const;

    std::shared_ptr<VectorRepository> repository_;
    std::shared_ptr<EmbeddingProvider> embedding_provider_;
    CacheConfig cache_config_;
    RegistryConfig registry_config_;

    mutable std::mutex mutex_;
    std::unordered_map<ScopeKey, Slot> scopes_;
    TimeSource time_source_;
};
