// benchmarks/search_benchmark.cpp
#include "../include/vector_knowledge_cache.hpp"
#include "../src/utils/random_generator.hpp"
#include <chrono>
#include <iostream>
#include <vector>

void benchmark_search(size_t dimensions, size_t num_vectors, size_t num_queries, size_t k) {
    CacheConfig config;
    config.max_vectors = 0;
    config.max_memory_kb = 1024 * 1024;
    VectorCacheStore store(config);
    SimilaritySearchEngine engine(config);
    RandomGenerator rng(42);

    // Insert vectors
    auto start = std::chrono::high_resolution_clock::now();
    for (size_t i = 0; i < num_vectors; ++i) {
        store.insert(VectorEntry("vector_" + std::to_string(i), rng.generateNormalVector(dimensions)));
    }
    auto end = std::chrono::high_resolution_clock::now();
    auto insert_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    // Generate queries
    std::vector<Vector> queries;
    for (size_t i = 0; i < num_queries; ++i) {
        queries.push_back(rng.generateNormalVector(dimensions));
    }

    SearchOptions options;
    options.threshold = -1.0f;
    options.limit = static_cast<int>(k);

    // Benchmark exact search
    size_t returned = 0;
    start = std::chrono::high_resolution_clock::now();
    for (const auto& query : queries) {
        returned += engine.search(store, query, options).size();
    }
    end = std::chrono::high_resolution_clock::now();
    auto search_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::cout << "Dimension: " << dimensions << ", Vectors: " << num_vectors << ", Queries: " << num_queries << ", k: " << k << std::endl;
    std::cout << "Insert time: " << insert_duration.count() << " ms (" << store.totalBytes() / 1024 << " KB)" << std::endl;
    std::cout << "Search time: " << search_duration.count() << " ms" << std::endl;
    std::cout << "Results returned: " << returned << std::endl << std::endl;
}

int main() {
    benchmark_search(128, 1000, 1000, 10);
    benchmark_search(384, 10000, 100, 5);
    benchmark_search(1536, 5000, 50, 5);
    return 0;
}
