#include <gtest/gtest.h>

#include <chrono>

#include "api/cache_registry.hpp"
#include "core/cache_errors.hpp"
#include "test_helpers.hpp"

namespace {

std::vector<VectorEntry> sampleKnowledge() {
    return {
        makeEntry("pricing", {1.0f, 0.0f, 0.0f}, "billing", "faq"),
        makeEntry("refunds", {0.8f, 0.6f, 0.0f}, "billing", "document"),
        makeEntry("shipping", {0.0f, 0.0f, 1.0f}, "logistics", "faq"),
    };
}

}  // namespace

class CacheRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<StubRepository>();
        provider_ = std::make_shared<StubEmbeddingProvider>();
        repo_->set(scope_a_, sampleKnowledge());
        repo_->set(scope_b_, {makeEntry("hours", {0.0f, 1.0f})});
        provider_->set("how much does it cost", Vector{1.0f, 0.05f, 0.0f});

        registry_ = std::make_unique<CacheRegistry>(repo_, provider_, CacheConfig{}, registry_config_);
        registry_->setTimeSource([this] { return now_; });
    }

    void advance(std::chrono::minutes m) { now_ += m; }

    ScopeKey scope_a_{"org-1", "bot-1", "v1"};
    ScopeKey scope_b_{"org-2", "bot-1", "v1"};
    RegistryConfig registry_config_;
    CacheRegistry::Clock::time_point now_{};
    std::shared_ptr<StubRepository> repo_;
    std::shared_ptr<StubEmbeddingProvider> provider_;
    std::unique_ptr<CacheRegistry> registry_;
};

TEST_F(CacheRegistryTest, GetCreatesAndWarmsOnce) {
    auto first = registry_->get(scope_a_);
    auto second = registry_->get(scope_a_);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first->state(), CacheLifecycleController::State::READY);
    EXPECT_EQ(repo_->load_all_calls, 1);
    EXPECT_EQ(registry_->scopeCount(), 1u);
}

TEST_F(CacheRegistryTest, ScopesAreIsolated) {
    auto a = registry_->search(scope_a_, Vector{1.0f, 0.0f, 0.0f});
    auto b = registry_->search(scope_b_, Vector{0.0f, 1.0f});

    EXPECT_EQ(idsOf(a).front(), "pricing");
    EXPECT_EQ(idsOf(b), (std::vector<std::string>{"hours"}));
    EXPECT_EQ(registry_->getStats(scope_a_).dimensions, 3u);
    EXPECT_EQ(registry_->getStats(scope_b_).dimensions, 2u);
}

TEST_F(CacheRegistryTest, TextSearchEmbedsThroughProvider) {
    SearchOptions options;
    options.threshold = 0.9f;
    auto results = registry_->searchText(scope_a_, "how much does it cost", options);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].entry->id(), "pricing");
}

TEST_F(CacheRegistryTest, EmbeddingFailuresPropagate) {
    try {
        registry_->searchText(scope_a_, "unknown question");
        FAIL() << "expected EmbeddingGenerationError";
    } catch (const EmbeddingGenerationError& e) {
        EXPECT_EQ(e.code(), "EMBEDDING_GENERATION_FAILED");
    }

    CacheRegistry no_provider(repo_);
    EXPECT_THROW(no_provider.searchText(scope_a_, "anything"), EmbeddingGenerationError);
}

TEST_F(CacheRegistryTest, InvalidateRoundTrip) {
    registry_->get(scope_a_);
    std::vector<VectorEntry> updated = sampleKnowledge();
    updated.push_back(makeEntry("warranty", {0.0f, 1.0f, 0.0f}));
    repo_->set(scope_a_, updated);

    registry_->invalidate(scope_a_);

    EXPECT_EQ(registry_->getStats(scope_a_).entry_count, 4u);
}

TEST_F(CacheRegistryTest, BracedQueryResolvesToVectorSearch) {
    auto results = registry_->search(scope_a_, {1, 0, 0});
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].entry->id(), "pricing");
}

TEST_F(CacheRegistryTest, EvictScopeAndClear) {
    registry_->get(scope_a_);
    registry_->get(scope_b_);

    EXPECT_TRUE(registry_->evictScope(scope_a_));
    EXPECT_FALSE(registry_->evictScope(scope_a_));
    EXPECT_FALSE(registry_->contains(scope_a_));
    EXPECT_TRUE(registry_->contains(scope_b_));

    // An evicted scope is rewarmed on next use.
    registry_->search(scope_a_, Vector{1.0f, 0.0f, 0.0f});
    EXPECT_EQ(repo_->load_all_calls, 3);

    registry_->clear();
    EXPECT_EQ(registry_->scopeCount(), 0u);
}

TEST_F(CacheRegistryTest, IdleScopesExpireAfterTtl) {
    registry_->get(scope_a_);
    advance(std::chrono::minutes(20));
    registry_->get(scope_b_);
    advance(std::chrono::minutes(15));

    // scope_a_ idle 35 min, scope_b_ 15 min.
    EXPECT_EQ(registry_->reclaimExpired(), 1u);
    EXPECT_FALSE(registry_->contains(scope_a_));
    EXPECT_TRUE(registry_->contains(scope_b_));
}

TEST_F(CacheRegistryTest, UseRefreshesTtl) {
    registry_->get(scope_a_);
    advance(std::chrono::minutes(25));
    registry_->search(scope_a_, Vector{1.0f, 0.0f, 0.0f});
    advance(std::chrono::minutes(25));

    EXPECT_EQ(registry_->reclaimExpired(), 0u);
    EXPECT_TRUE(registry_->contains(scope_a_));
}

TEST_F(CacheRegistryTest, LeastRecentlyUsedScopesDroppedBeyondMax) {
    RegistryConfig small;
    small.max_scopes = 2;
    CacheRegistry registry(repo_, provider_, CacheConfig{}, small);
    registry.setTimeSource([this] { return now_; });

    ScopeKey scope_c{"org-3", "bot-1", "v1"};
    repo_->set(scope_c, {makeEntry("x", {1.0f})});

    registry.get(scope_a_);
    advance(std::chrono::minutes(1));
    registry.get(scope_b_);
    advance(std::chrono::minutes(1));
    registry.get(scope_a_);  // scope_b_ is now least recently used
    advance(std::chrono::minutes(1));
    registry.get(scope_c);

    EXPECT_EQ(registry.scopeCount(), 2u);
    EXPECT_TRUE(registry.contains(scope_a_));
    EXPECT_FALSE(registry.contains(scope_b_));
    EXPECT_TRUE(registry.contains(scope_c));
}

TEST_F(CacheRegistryTest, HealthCheckAggregatesScopes) {
    EXPECT_TRUE(registry_->healthCheck().ready);

    registry_->get(scope_a_);
    registry_->get(scope_b_);
    auto health = registry_->healthCheck();
    EXPECT_TRUE(health.ready);
    EXPECT_EQ(health.scope_count, 2u);
    EXPECT_EQ(health.entry_count, 4u);
    EXPECT_GT(health.memory_kb, 0.0);
    EXPECT_TRUE(health.failed_scopes.empty());

    ScopeKey broken{"org-9", "bot-9", "v1"};
    repo_->fail_next_loads = 1;
    EXPECT_THROW(registry_->get(broken), CacheInitializationError);

    health = registry_->healthCheck();
    EXPECT_FALSE(health.ready);
    EXPECT_EQ(health.failed_scopes, (std::vector<std::string>{"org-9/bot-9@v1"}));

    json j = health;
    EXPECT_EQ(j["ready"], false);
    EXPECT_EQ(j["scope_count"], 3);

    registry_->retry(broken);
    EXPECT_TRUE(registry_->healthCheck().ready);
}

TEST_F(CacheRegistryTest, VerifyIntegrityThroughRegistry) {
    auto controller = registry_->get(scope_a_);
    VectorCacheStoreTestPeer::corruptHash(*controller->acquireStore(), "refunds");

    auto report = registry_->verifyIntegrity(scope_a_);
    EXPECT_EQ(report.recoverableIds(), (std::vector<std::string>{"refunds"}));
    EXPECT_TRUE(registry_->verifyIntegrity(scope_a_).clean());
}

TEST_F(CacheRegistryTest, StatsSerializeToJson) {
    registry_->search(scope_a_, Vector{1.0f, 0.0f, 0.0f});
    json j = registry_->getStats(scope_a_);

    EXPECT_EQ(j["entry_count"], 3);
    EXPECT_EQ(j["state"], "READY");
    EXPECT_EQ(j["searches_performed"], 1);
    EXPECT_TRUE(j["last_eviction_ms"].is_null());
}
