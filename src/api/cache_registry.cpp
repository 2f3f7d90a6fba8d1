#include "cache_registry.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "../core/cache_errors.hpp"

// -------------------- RegistryConfig --------------------

void RegistryConfig::validate() const {
    if (scope_ttl.count() <= 0) throw std::invalid_argument("scope_ttl must be positive");
    if (scope_ttl > std::chrono::hours(24 * 365)) {
        throw std::invalid_argument("scope_ttl must be at most one year");
    }
}

void to_json(json& j, const RegistryConfig& c) {
    j = json{
        {"scope_ttl_ms", c.scope_ttl.count()},
        {"max_scopes", c.max_scopes}
    };
}

void from_json(const json& j, RegistryConfig& c) {
    if (!j.is_object()) {
        throw std::invalid_argument("RegistryConfig must be a JSON object");
    }
    c.scope_ttl = std::chrono::milliseconds(
        j.value("scope_ttl_ms", static_cast<int64_t>(c.scope_ttl.count())));
    c.max_scopes = static_cast<size_t>(readNonNegative(j, "max_scopes", c.max_scopes));
    c.validate();
}

void to_json(json& j, const HealthStatus& h) {
    j = json{
        {"ready", h.ready},
        {"scope_count", h.scope_count},
        {"entry_count", h.entry_count},
        {"memory_kb", h.memory_kb},
        {"failed_scopes", h.failed_scopes}
    };
}

// -------------------- CacheRegistry --------------------

CacheRegistry::CacheRegistry(std::shared_ptr<VectorRepository> repository,
                             std::shared_ptr<EmbeddingProvider> embedding_provider,
                             const CacheConfig& cache_config,
                             const RegistryConfig& registry_config)
    : repository_(std::move(repository)),
      embedding_provider_(std::move(embedding_provider)),
      cache_config_(cache_config),
      registry_config_(registry_config),
      time_source_([] { return Clock::now(); }) {
    if (!repository_) throw std::invalid_argument("CacheRegistry requires a VectorRepository");
    cache_config_.validate();
    registry_config_.validate();
}

void CacheRegistry::setTimeSource(TimeSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    time_source_ = source ? std::move(source) : TimeSource([] { return Clock::now(); });
}

CacheRegistry::Clock::time_point CacheRegistry::now() const {
    return time_source_();
}

CacheRegistry::ControllerPtr CacheRegistry::touch(const ScopeKey& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto t = now();
    reclaimLocked(t, &scope);

    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        auto controller = std::make_shared<CacheLifecycleController>(scope, repository_, cache_config_);
        it = scopes_.emplace(scope, Slot{std::move(controller), t}).first;
        reclaimLocked(t, &scope);  // may now exceed max_scopes
    }
    it->second.last_used = t;
    return it->second.controller;
}

size_t CacheRegistry::reclaimLocked(Clock::time_point t, const ScopeKey* keep) {
    size_t dropped = 0;

    for (auto it = scopes_.begin(); it != scopes_.end();) {
        bool kept = keep && it->first == *keep;
        if (!kept && t - it->second.last_used > registry_config_.scope_ttl) {
            it = scopes_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (registry_config_.max_scopes > 0 && scopes_.size() > registry_config_.max_scopes) {
        std::vector<std::pair<Clock::time_point, ScopeKey>> by_age;
        for (const auto& kv : scopes_) {
            if (keep && kv.first == *keep) continue;
            by_age.emplace_back(kv.second.last_used, kv.first);
        }
        std::sort(by_age.begin(), by_age.end());
        size_t excess = scopes_.size() - registry_config_.max_scopes;
        for (size_t i = 0; i < excess && i < by_age.size(); ++i) {
            scopes_.erase(by_age[i].second);
            ++dropped;
        }
    }

    if (dropped > 0) {
        std::cout << "[Registry] Reclaimed " << dropped << " scope(s), "
                  << scopes_.size() << " remaining" << std::endl;
    }
    return dropped;
}

size_t CacheRegistry::reclaimExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reclaimLocked(now(), nullptr);
}

CacheRegistry::ControllerPtr CacheRegistry::get(const ScopeKey& scope) {
    ControllerPtr controller = touch(scope);
    controller->acquireStore();
    return controller;
}

std::vector<SearchResult> CacheRegistry::search(const ScopeKey& scope, const Vector& query,
                                                const SearchOptions& options) {
    return touch(scope)->search(query, options);
}

std::vector<SearchResult> CacheRegistry::searchText(const ScopeKey& scope, const std::string& text,
                                                    const SearchOptions& options) {
    if (!embedding_provider_) {
        throw EmbeddingGenerationError("no embedding provider configured");
    }
    Vector query;
    try {
        query = embedding_provider_->embed(text);
    } catch (const EmbeddingGenerationError&) {
        throw;
    } catch (const std::exception& ex) {
        throw EmbeddingGenerationError(ex.what());
    }
    return search(scope, query, options);
}

void CacheRegistry::invalidate(const ScopeKey& scope) {
    touch(scope)->invalidate();
}

void CacheRegistry::retry(const ScopeKey& scope) {
    touch(scope)->retry();
}

bool CacheRegistry::evictScope(const ScopeKey& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool erased = scopes_.erase(scope) > 0;
    if (erased) std::cout << "[Registry] Evicted scope " << scope.toString() << std::endl;
    return erased;
}

void CacheRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[Registry] Cleared " << scopes_.size() << " scope(s)" << std::endl;
    scopes_.clear();
}

CacheStats CacheRegistry::getStats(const ScopeKey& scope) {
    return touch(scope)->getStats();
}

IntegrityReport CacheRegistry::verifyIntegrity(const ScopeKey& scope) {
    return touch(scope)->verifyIntegrity();
}

HealthStatus CacheRegistry::healthCheck() const {
    std::vector<ControllerPtr> controllers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        controllers.reserve(scopes_.size());
        for (const auto& kv : scopes_) controllers.push_back(kv.second.controller);
    }

    HealthStatus health;
    health.scope_count = controllers.size();
    for (const auto& controller : controllers) {
        CacheStats stats = controller->getStats();
        health.entry_count += stats.entry_count;
        health.memory_kb += stats.memory_kb;

        auto state = controller->state();
        if (state == CacheLifecycleController::State::FAILED) {
            health.failed_scopes.push_back(controller->scope().toString());
            health.ready = false;
        } else if (state == CacheLifecycleController::State::WARMING) {
            health.ready = false;
        }
    }
    std::sort(health.failed_scopes.begin(), health.failed_scopes.end());
    return health;
}

size_t CacheRegistry::scopeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scopes_.size();
}

bool CacheRegistry::contains(const ScopeKey& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scopes_.count(scope) > 0;
}
