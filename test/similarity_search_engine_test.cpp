#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "algorithms/similarity_search_engine.hpp"
#include "core/cache_errors.hpp"
#include "core/vector_cache_store.hpp"
#include "test_helpers.hpp"

class SimilaritySearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.setTimeSource(clock_.source());
    }

    SearchOptions opts(float threshold, int limit) {
        SearchOptions o;
        o.threshold = threshold;
        o.limit = limit;
        return o;
    }

    FakeClock clock_;
    VectorCacheStore store_;
    SimilaritySearchEngine engine_;
};

TEST_F(SimilaritySearchEngineTest, ExactMatchScenario) {
    store_.insert(makeEntry("a", {1.0f, 0.0f, 0.0f}));
    store_.insert(makeEntry("b", {0.0f, 1.0f, 0.0f}));

    auto results = engine_.search(store_, {1.0f, 0.0f, 0.0f}, opts(0.5f, 5));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].entry->id(), "a");
    EXPECT_NEAR(results[0].similarity, 1.0f, 1e-6f);
}

TEST_F(SimilaritySearchEngineTest, RanksByScoreAndExcludesBelowThreshold) {
    // cos(q,a)=1.0, cos(q,b)~0.707, cos(q,c)=0.0
    store_.insert(makeEntry("c", {0.0f, 1.0f}));
    store_.insert(makeEntry("b", {1.0f, 1.0f}));
    store_.insert(makeEntry("a", {1.0f, 0.0f}));

    auto results = engine_.search(store_, {1.0f, 0.0f}, opts(0.5f, 5));

    EXPECT_EQ(idsOf(results), (std::vector<std::string>{"a", "b"}));
    EXPECT_GT(results[0].similarity, results[1].similarity);
}

TEST_F(SimilaritySearchEngineTest, DefaultsAreThresholdPointFifteenAndLimitFive) {
    for (int i = 0; i < 8; ++i) {
        store_.insert(makeEntry("e" + std::to_string(i), {1.0f, 0.1f * i}));
    }
    store_.insert(makeEntry("weak", {0.1f, 1.0f}));  // cos ~ 0.0995

    auto results = engine_.search(store_, {1.0f, 0.0f});
    EXPECT_EQ(results.size(), 5u);
    EXPECT_EQ(engine_.defaultLimit(), 5u);
    EXPECT_FLOAT_EQ(engine_.defaultThreshold(), 0.15f);

    SearchOptions unlimited;
    unlimited.limit = 100;
    auto all = engine_.search(store_, {1.0f, 0.0f}, unlimited);
    EXPECT_EQ(all.size(), 8u);
}

TEST_F(SimilaritySearchEngineTest, ThresholdOneReturnsOnlyExactMatches) {
    store_.insert(makeEntry("exact", {0.3f, 0.4f, 0.5f}));
    store_.insert(makeEntry("scaled", {0.6f, 0.8f, 1.0f}));
    store_.insert(makeEntry("close", {0.3f, 0.4f, 0.51f}));

    auto results = engine_.search(store_, {0.3f, 0.4f, 0.5f}, opts(1.0f, 10));

    auto ids = idsOf(results);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"exact", "scaled"}));
    for (const auto& r : results) EXPECT_NEAR(r.similarity, 1.0f, 1e-6f);
}

TEST_F(SimilaritySearchEngineTest, LimitZeroReturnsEmptyWithoutError) {
    store_.insert(makeEntry("a", {1.0f, 0.0f}));
    auto results = engine_.search(store_, {1.0f, 0.0f}, opts(0.0f, 0));
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(store_.get("a")->accessCount(), 0u);
}

TEST_F(SimilaritySearchEngineTest, EmptyStoreReturnsEmpty) {
    EXPECT_TRUE(engine_.search(store_, {1.0f, 0.0f}).empty());
}

TEST_F(SimilaritySearchEngineTest, QueryDimensionMismatchThrows) {
    store_.insert(makeEntry("a", {1.0f, 0.0f, 0.0f}));
    try {
        engine_.search(store_, {1.0f, 0.0f});
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.vectorSource(), "query");
        EXPECT_EQ(e.expected(), 3u);
        EXPECT_EQ(e.actual(), 2u);
    }
}

TEST_F(SimilaritySearchEngineTest, ZeroMagnitudeQueryAndEntriesNeverMatch) {
    store_.insert(makeEntry("zero", {0.0f, 0.0f}));
    store_.insert(makeEntry("a", {1.0f, 0.0f}));

    EXPECT_TRUE(engine_.search(store_, {0.0f, 0.0f}, opts(-1.0f, 5)).empty());
    EXPECT_EQ(idsOf(engine_.search(store_, {1.0f, 0.0f}, opts(-1.0f, 5))),
              (std::vector<std::string>{"a"}));
}

TEST_F(SimilaritySearchEngineTest, FiltersApplyBeforeScoring) {
    store_.insert(makeEntry("faq", {1.0f, 0.0f}, "billing", "faq"));
    store_.insert(makeEntry("doc", {1.0f, 0.0f}, "billing", "document"));
    store_.insert(makeEntry("other", {1.0f, 0.0f}, "shipping", "faq"));

    SearchOptions o = opts(0.5f, 5);
    o.category_filter = "billing";
    EXPECT_EQ(idsOf(engine_.search(store_, {1.0f, 0.0f}, o)),
              (std::vector<std::string>{"doc", "faq"}));

    o.source_type_filter = "faq";
    EXPECT_EQ(idsOf(engine_.search(store_, {1.0f, 0.0f}, o)),
              (std::vector<std::string>{"faq"}));
}

TEST_F(SimilaritySearchEngineTest, TiesBreakByRecencyThenId) {
    store_.insert(makeEntry("b", {1.0f, 0.0f}));
    store_.insert(makeEntry("a", {1.0f, 0.0f}));
    store_.insert(makeEntry("c", {1.0f, 0.0f}));

    // Same score and same access time: ascending id.
    auto first = engine_.search(store_, {1.0f, 0.0f}, opts(0.5f, 2));
    EXPECT_EQ(idsOf(first), (std::vector<std::string>{"a", "b"}));

    // "c" was the only one not returned; touch it later so it is most recent.
    clock_.advance(std::chrono::seconds(1));
    store_.get("c")->recordAccess(clock_.now() + std::chrono::seconds(1));
    auto second = engine_.search(store_, {1.0f, 0.0f}, opts(0.5f, 3));
    EXPECT_EQ(idsOf(second), (std::vector<std::string>{"c", "a", "b"}));
}

TEST_F(SimilaritySearchEngineTest, RepeatedSearchesAreDeterministic) {
    for (int i = 0; i < 20; ++i) {
        float angle = 0.05f * static_cast<float>(i);
        store_.insert(makeEntry("e" + std::to_string(i), {std::cos(angle), std::sin(angle)}));
    }
    auto first = engine_.search(store_, {1.0f, 0.2f}, opts(0.0f, 10));
    auto second = engine_.search(store_, {1.0f, 0.2f}, opts(0.0f, 10));
    EXPECT_EQ(idsOf(first), idsOf(second));
}

TEST_F(SimilaritySearchEngineTest, ReturnedEntriesRecordAccess) {
    store_.insert(makeEntry("hit", {1.0f, 0.0f}));
    store_.insert(makeEntry("miss", {0.0f, 1.0f}));
    clock_.advance(std::chrono::seconds(30));

    engine_.search(store_, {1.0f, 0.0f}, opts(0.5f, 5));

    EXPECT_EQ(store_.get("hit")->accessCount(), 1u);
    EXPECT_EQ(store_.get("hit")->lastAccessedAt(), clock_.now());
    EXPECT_EQ(store_.get("miss")->accessCount(), 0u);
}

TEST_F(SimilaritySearchEngineTest, MalformedOptionsThrow) {
    store_.insert(makeEntry("a", {1.0f, 0.0f}));
    EXPECT_THROW(engine_.search(store_, {1.0f, 0.0f}, opts(1.5f, 5)), VectorSearchError);
    EXPECT_THROW(engine_.search(store_, {1.0f, 0.0f}, opts(std::nanf(""), 5)), VectorSearchError);
    EXPECT_THROW(engine_.search(store_, {1.0f, 0.0f}, opts(0.5f, -1)), VectorSearchError);

    SearchOptions empty_filter;
    empty_filter.category_filter = "";
    EXPECT_THROW(engine_.search(store_, {1.0f, 0.0f}, empty_filter), VectorSearchError);

    EXPECT_THROW(engine_.search(store_, {std::numeric_limits<float>::infinity(), 0.0f}),
                 VectorSearchError);
}
