#include <gtest/gtest.h>

#include <chrono>
#include <limits>

#include "core/scope_key.hpp"
#include "core/vector.hpp"
#include "core/vector_entry.hpp"
#include "test_helpers.hpp"

TEST(VectorTest, DotProductAndMagnitude) {
    Vector a{3.0f, 4.0f};
    Vector b{1.0f, 0.0f};

    EXPECT_DOUBLE_EQ(a.magnitude(), 5.0);
    EXPECT_DOUBLE_EQ(Vector::dot_product(a, b), 3.0);
    EXPECT_THROW(Vector::dot_product(a, Vector{1.0f}), std::invalid_argument);
}

TEST(VectorTest, DetectsNonFiniteComponents) {
    EXPECT_TRUE((Vector{1.0f, 2.0f}).is_finite());
    EXPECT_FALSE((Vector{1.0f, std::numeric_limits<float>::quiet_NaN()}).is_finite());
    EXPECT_FALSE((Vector{std::numeric_limits<float>::infinity()}).is_finite());
}

TEST(VectorEntryTest, ContentHashIsStableHex) {
    auto a = makeEntry("a", {1.0f, 0.0f, 0.0f});
    auto b = makeEntry("a", {1.0f, 0.0f, 0.0f});

    std::string hash = a.computeContentHash();
    EXPECT_EQ(hash.size(), 64u);
    EXPECT_EQ(hash.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(hash, b.computeContentHash());
}

TEST(VectorEntryTest, ContentHashTracksContentAndEmbedding) {
    auto base = makeEntry("a", {1.0f, 0.0f, 0.0f});
    auto moved = makeEntry("a", {1.0f, 0.0f, 0.5f});
    auto recategorized = makeEntry("a", {1.0f, 0.0f, 0.0f}, "billing");

    EXPECT_NE(base.computeContentHash(), moved.computeContentHash());
    EXPECT_NE(base.computeContentHash(), recategorized.computeContentHash());
}

TEST(VectorEntryTest, FieldBoundariesAffectHash) {
    EntryMetadata m1;
    m1.title = "ab";
    m1.content = "c";
    EntryMetadata m2;
    m2.title = "a";
    m2.content = "bc";

    VectorEntry e1("x", Vector{1.0f}, m1);
    VectorEntry e2("x", Vector{1.0f}, m2);
    EXPECT_NE(e1.computeContentHash(), e2.computeContentHash());
}

TEST(VectorEntryTest, PriorityAndExtensionsAffectHash) {
    auto base = makeEntry("a", {1.0f, 0.0f});
    auto urgent = makeEntry("a", {1.0f, 0.0f}, "general", "faq", 5);

    EntryMetadata meta = base.metadata();
    meta.extensions["lang"] = "en";
    VectorEntry extended("a", base.embedding(), meta);

    // A tag must not collide with an extension key/value pair.
    EntryMetadata as_tags = base.metadata();
    as_tags.tags = {"lang", "en"};
    VectorEntry tagged("a", base.embedding(), as_tags);

    EXPECT_NE(base.computeContentHash(), urgent.computeContentHash());
    EXPECT_NE(base.computeContentHash(), extended.computeContentHash());
    EXPECT_NE(extended.computeContentHash(), tagged.computeContentHash());
}

// Pins the hashed layout so repositories can pre-compute matching digests.
TEST(VectorEntryTest, ContentHashMatchesDocumentedLayout) {
    EntryMetadata meta;
    meta.title = "Refunds";
    meta.content = "30 days";
    meta.category = "billing";
    meta.source_type = "faq";
    meta.tags = {"policy"};
    meta.extensions["lang"] = "en";
    meta.priority = 2;
    VectorEntry entry("refunds", Vector{1.0f, 0.5f}, meta);

    EXPECT_EQ(entry.computeContentHash(),
              "38d30558aa03932df0ffc2719bfe656670c9d5dcb386a297bd4b418c0cc255d5");
}

TEST(VectorEntryTest, SizeGrowsWithDimensionsAndText) {
    auto small = makeEntry("a", {1.0f, 0.0f});
    auto wider = makeEntry("a", {1.0f, 0.0f, 0.0f, 0.0f});
    EXPECT_EQ(chargedBytes(wider) - chargedBytes(small), 2 * sizeof(float));

    EntryMetadata meta;
    meta.content = std::string(1000, 'x');
    meta.tags = {"pricing", "plans"};
    VectorEntry verbose("a", Vector{1.0f, 0.0f}, meta);
    EXPECT_GE(chargedBytes(verbose), chargedBytes(small) + 1000);
}

TEST(VectorEntryTest, RecordAccessNeverMovesBackwards) {
    auto entry = makeEntry("a", {1.0f});
    VectorEntry::TimePoint t0(std::chrono::seconds(100));
    entry.setUsage(t0, 0);

    entry.recordAccess(t0 + std::chrono::seconds(5));
    entry.recordAccess(t0 + std::chrono::seconds(2));

    EXPECT_EQ(entry.lastAccessedAt(), t0 + std::chrono::seconds(5));
    EXPECT_EQ(entry.accessCount(), 2u);
}

TEST(VectorEntryTest, CopyKeepsUsage) {
    auto entry = makeEntry("a", {1.0f});
    VectorEntry::TimePoint t(std::chrono::seconds(42));
    entry.setUsage(t, 7);

    VectorEntry copy(entry);
    EXPECT_EQ(copy.lastAccessedAt(), t);
    EXPECT_EQ(copy.accessCount(), 7u);
}

TEST(ScopeKeyTest, ComparesByValue) {
    ScopeKey a{"org", "bot", "v1"};
    ScopeKey b{"org", "bot", "v1"};
    ScopeKey c{"org", "bot", "v2"};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<ScopeKey>()(a), std::hash<ScopeKey>()(b));
    EXPECT_EQ(a.toString(), "org/bot@v1");
}
