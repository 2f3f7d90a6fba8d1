// src/core/cache_config.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class EvictionStrategy {
    LRU,
    LFU,
    RANDOM,
    PRIORITY
};

const char* to_string(EvictionStrategy strategy);
// Accepts "lru", "lfu", "random", "priority"; throws std::invalid_argument otherwise.
EvictionStrategy parseEvictionStrategy(const std::string& name);

// ========================== CacheConfig ==========================
// Per-scope knobs. Every scope created by a registry gets a copy.
struct CacheConfig {
    // Memory budget
    size_t           max_memory_kb    = 50 * 1024;  // 50MB
    size_t           max_vectors      = 10'000;     // 0 = unlimited
    double           headroom_factor  = 0.9;        // evict down to budget * headroom
    EvictionStrategy eviction_strategy = EvictionStrategy::LRU;
    size_t           eviction_batch_size = 100;
    uint64_t         random_seed      = 0;          // 0 = seed from std::random_device

    // Search defaults
    float  default_threshold = 0.15f;
    size_t default_limit     = 5;
    size_t hit_rate_window   = 100;

    // Dimensionality; 0 = taken from the first inserted entry
    size_t dimensions = 0;

    // Warm-up
    size_t warm_batch_size = 500;
    std::chrono::milliseconds warm_timeout{30'000};

    // Integrity
    bool   integrity_check_enabled = true;
    double max_recoverable_corruption_rate = 0.25;

    bool verbose_logging = false;

    size_t maxMemoryBytes() const { return max_memory_kb * 1024; }

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

// Reads a non-negative integer field; a missing key yields `fallback`.
// Throws std::invalid_argument on negative or non-integer values.
uint64_t readNonNegative(const json& j, const char* key, uint64_t fallback);

void to_json(json& j, const CacheConfig& c);
// Missing keys keep their defaults. The result is validated.
void from_json(const json& j, CacheConfig& c);
