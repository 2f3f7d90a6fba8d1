#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/cache_config.hpp"
#include "../core/vector.hpp"
#include "../core/vector_entry.hpp"

class VectorCacheStore;

struct SearchOptions {
    std::optional<float> threshold;  // unset: engine default (0.15)
    std::optional<int> limit;        // unset: engine default (5)
    std::optional<std::string> category_filter;
    std::optional<std::string> source_type_filter;
};

struct SearchResult {
    std::shared_ptr<const VectorEntry> entry;
    float similarity;
};

void to_json(json& j, const SearchResult& r);

/**
 * Exact (flat) cosine-similarity search over one store.
 *
 * Filters run before scoring. Results with similarity >= threshold are ranked
 * by score desc, then most recent access, then id asc, and cut to `limit`.
 * Every returned entry has its access time and count updated.
 *
 * Cost is O(n * d) per query.
 */
class SimilaritySearchEngine {
public:
    // Absorbs float rounding so threshold 1.0 still matches identical vectors.
    static constexpr float kScoreTolerance = 1e-6f;

    SimilaritySearchEngine() = default;
    SimilaritySearchEngine(float default_threshold, size_t default_limit);
    explicit SimilaritySearchEngine(const CacheConfig& config);

    // Empty result is a normal outcome. Throws DimensionMismatchError when the
    // query length differs from the store's and VectorSearchError on bad options.
    std::vector<SearchResult> search(const VectorCacheStore& store,
                                     const Vector& query,
                                     const SearchOptions& options = SearchOptions{}) const;

    float defaultThreshold() const { return default_threshold_; }
    size_t defaultLimit() const { return default_limit_; }

private:
    void validateOptions(const SearchOptions& options) const;

    float default_threshold_ = 0.15f;
    size_t default_limit_ = 5;
    bool verbose_ = false;
};
