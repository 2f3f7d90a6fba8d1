//examples/basic_usage.cpp
#include "../include/vector_knowledge_cache.hpp"
#include "../src/utils/random_generator.hpp"
#include <functional>
#include <iostream>
#include <memory>

// Repository backed by random 128-dimensional embeddings.
class DemoRepository : public VectorRepository {
public:
    std::vector<VectorEntry> loadAll(const ScopeKey& scope, const LoadControl&) override {
        RandomGenerator rng(7);
        std::vector<VectorEntry> entries;
        const char* categories[] = {"billing", "shipping", "product"};
        for (int i = 0; i < 1000; ++i) {
            EntryMetadata meta;
            meta.title = "Article " + std::to_string(i);
            meta.content = "Knowledge base article " + std::to_string(i) + " for " + scope.organization_id;
            meta.category = categories[i % 3];
            meta.source_type = (i % 2 == 0) ? "faq" : "document";
            entries.emplace_back("article_" + std::to_string(i), rng.generateUniformVector(128, -1.0f, 1.0f), meta);
        }
        return entries;
    }
};

// Same text always embeds to the same vector.
class DemoEmbeddingProvider : public EmbeddingProvider {
public:
    Vector embed(const std::string& text) override {
        RandomGenerator rng(static_cast<unsigned int>(std::hash<std::string>()(text)));
        return rng.generateUniformVector(128, -1.0f, 1.0f);
    }
};

int main() {
    CacheConfig config;
    config.max_memory_kb = 512;
    config.eviction_strategy = EvictionStrategy::LFU;

    CacheRegistry registry(std::make_shared<DemoRepository>(),
                           std::make_shared<DemoEmbeddingProvider>(),
                           config);

    ScopeKey scope{"acme", "support-bot", "2024-06-01"};

    SearchOptions options;
    options.threshold = 0.05f;
    options.limit = 5;
    options.category_filter = "billing";

    auto results = registry.searchText(scope, "How do I update my card?", options);

    std::cout << "Top billing articles:" << std::endl;
    for (const auto& r : results) {
        std::cout << r.entry->id() << " (" << r.entry->metadata().title << "): similarity = "
                  << r.similarity << std::endl;
    }

    std::cout << json(registry.getStats(scope)).dump(2) << std::endl;
    std::cout << json(registry.healthCheck()).dump(2) << std::endl;

    return 0;
}
