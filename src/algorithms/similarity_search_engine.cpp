#include "similarity_search_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <shared_mutex>

#include "../core/cache_errors.hpp"
#include "../core/vector_cache_store.hpp"
#include "../utils/distance_metrics.hpp"

namespace {

struct ScoredCandidate {
    std::shared_ptr<const VectorEntry> entry;
    float similarity;
    VectorEntry::TimePoint last_accessed;  // snapshot; sort must not see it move
};

bool rankedBefore(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    if (a.last_accessed != b.last_accessed) return a.last_accessed > b.last_accessed;
    return a.entry->id() < b.entry->id();
}

}  // namespace

void to_json(json& j, const SearchResult& r) {
    j = json{
        {"id", r.entry ? r.entry->id() : std::string()},
        {"similarity", r.similarity},
        {"category", r.entry ? r.entry->category() : std::string()},
        {"source_type", r.entry ? r.entry->sourceType() : std::string()}
    };
}

SimilaritySearchEngine::SimilaritySearchEngine(float default_threshold, size_t default_limit)
    : default_threshold_(default_threshold), default_limit_(default_limit) {}

SimilaritySearchEngine::SimilaritySearchEngine(const CacheConfig& config)
    : default_threshold_(config.default_threshold),
      default_limit_(config.default_limit),
      verbose_(config.verbose_logging) {}

void SimilaritySearchEngine::validateOptions(const SearchOptions& options) const {
    if (options.threshold) {
        float t = *options.threshold;
        if (std::isnan(t) || t < -1.0f || t > 1.0f) {
            throw VectorSearchError("threshold must be within [-1, 1]");
        }
    }
    if (options.limit && *options.limit < 0) {
        throw VectorSearchError("limit must not be negative");
    }
    if (options.category_filter && options.category_filter->empty()) {
        throw VectorSearchError("category filter is set but empty");
    }
    if (options.source_type_filter && options.source_type_filter->empty()) {
        throw VectorSearchError("source type filter is set but empty");
    }
}

std::vector<SearchResult> SimilaritySearchEngine::search(const VectorCacheStore& store,
                                                         const Vector& query,
                                                         const SearchOptions& options) const {
    validateOptions(options);
    if (!query.is_finite()) {
        throw VectorSearchError("query embedding contains NaN or infinite values");
    }

    const float threshold = options.threshold.value_or(default_threshold_);
    const size_t limit = options.limit ? static_cast<size_t>(*options.limit) : default_limit_;

    std::vector<ScoredCandidate> candidates;
    size_t scanned = 0;
    {
        std::shared_lock<std::shared_mutex> lock(store.mutex_);

        if (store.dimensions_ == 0) return {};  // nothing inserted yet
        if (query.size() != store.dimensions_) {
            throw DimensionMismatchError(store.dimensions_, query.size(), "query");
        }
        if (limit == 0) return {};

        const double query_norm = query.magnitude();
        if (query_norm == 0.0) return {};

        for (const auto& entry : store.entries_) {
            if (options.category_filter && entry->category() != *options.category_filter) continue;
            if (options.source_type_filter && entry->sourceType() != *options.source_type_filter) continue;
            ++scanned;

            auto score = CosineSimilarity::similarity(query, query_norm,
                                                      entry->embedding(), entry->magnitude());
            if (!score) continue;  // zero-magnitude entry
            if (*score + kScoreTolerance < threshold) continue;

            candidates.push_back({entry, *score, entry->lastAccessedAt()});
        }
    }

    const size_t keep = std::min(limit, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + keep, candidates.end(), rankedBefore);
    candidates.resize(keep);

    const auto now = store.now();
    std::vector<SearchResult> results;
    results.reserve(keep);
    for (const auto& c : candidates) {
        c.entry->recordAccess(now);
        results.push_back({c.entry, c.similarity});
    }

    if (verbose_) {
        std::cout << "[VectorCache] Scored " << scanned << " of " << store.size()
                  << " entries (threshold " << threshold << ", limit " << limit << "), "
                  << results.size() << " result(s)" << std::endl;
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << results[i].entry->id() << ": "
                      << std::fixed << std::setprecision(3) << results[i].similarity
                      << std::defaultfloat << std::endl;
        }
    }
    return results;
}
