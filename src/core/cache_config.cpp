#include "cache_config.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

const char* to_string(EvictionStrategy strategy) {
    switch (strategy) {
        case EvictionStrategy::LRU:      return "lru";
        case EvictionStrategy::LFU:      return "lfu";
        case EvictionStrategy::RANDOM:   return "random";
        case EvictionStrategy::PRIORITY: return "priority";
        default:                         return "unknown";
    }
}

EvictionStrategy parseEvictionStrategy(const std::string& name) {
    if (name == "lru")      return EvictionStrategy::LRU;
    if (name == "lfu")      return EvictionStrategy::LFU;
    if (name == "random")   return EvictionStrategy::RANDOM;
    if (name == "priority") return EvictionStrategy::PRIORITY;
    throw std::invalid_argument("Unknown eviction strategy: " + name);
}

void CacheConfig::validate() const {
    if (max_memory_kb == 0) {
        throw std::invalid_argument("max_memory_kb must be positive");
    }
    if (max_memory_kb > std::numeric_limits<size_t>::max() / 1024) {
        throw std::invalid_argument("max_memory_kb is too large to express in bytes");
    }
    if (!(headroom_factor > 0.0 && headroom_factor <= 1.0)) {
        throw std::invalid_argument("headroom_factor must be in (0, 1]");
    }
    if (eviction_batch_size == 0) {
        throw std::invalid_argument("eviction_batch_size must be positive");
    }
    if (std::isnan(default_threshold) || default_threshold < -1.0f || default_threshold > 1.0f) {
        throw std::invalid_argument("default_threshold must be in [-1, 1]");
    }
    if (hit_rate_window == 0) {
        throw std::invalid_argument("hit_rate_window must be positive");
    }
    if (warm_batch_size == 0) {
        throw std::invalid_argument("warm_batch_size must be positive");
    }
    if (warm_timeout.count() <= 0) {
        throw std::invalid_argument("warm_timeout_ms must be positive");
    }
    if (warm_timeout > std::chrono::hours(24)) {
        throw std::invalid_argument("warm_timeout_ms must be at most one day");
    }
    if (!(max_recoverable_corruption_rate >= 0.0 && max_recoverable_corruption_rate <= 1.0)) {
        throw std::invalid_argument("max_recoverable_corruption_rate must be in [0, 1]");
    }
}

uint64_t readNonNegative(const json& j, const char* key, uint64_t fallback) {
    if (!j.contains(key)) return fallback;
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    int64_t signed_value = value.get<int64_t>();
    if (signed_value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return static_cast<uint64_t>(signed_value);
}

namespace {

size_t readSize(const json& j, const char* key, size_t fallback) {
    uint64_t value = readNonNegative(j, key, fallback);
    if (value > std::numeric_limits<size_t>::max()) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return static_cast<size_t>(value);
}

}  // namespace

void to_json(json& j, const CacheConfig& c) {
    j = json{
        {"max_memory_kb", c.max_memory_kb},
        {"max_vectors", c.max_vectors},
        {"headroom_factor", c.headroom_factor},
        {"eviction_strategy", to_string(c.eviction_strategy)},
        {"eviction_batch_size", c.eviction_batch_size},
        {"random_seed", c.random_seed},
        {"default_threshold", c.default_threshold},
        {"default_limit", c.default_limit},
        {"hit_rate_window", c.hit_rate_window},
        {"dimensions", c.dimensions},
        {"warm_batch_size", c.warm_batch_size},
        {"warm_timeout_ms", c.warm_timeout.count()},
        {"integrity_check_enabled", c.integrity_check_enabled},
        {"max_recoverable_corruption_rate", c.max_recoverable_corruption_rate},
        {"verbose_logging", c.verbose_logging}
    };
}

void from_json(const json& j, CacheConfig& c) {
    if (!j.is_object()) {
        throw std::invalid_argument("CacheConfig must be a JSON object");
    }
    c.max_memory_kb       = readSize(j, "max_memory_kb", c.max_memory_kb);
    c.max_vectors         = readSize(j, "max_vectors", c.max_vectors);
    c.headroom_factor     = j.value("headroom_factor", c.headroom_factor);
    c.eviction_batch_size = readSize(j, "eviction_batch_size", c.eviction_batch_size);
    c.random_seed         = readNonNegative(j, "random_seed", c.random_seed);
    c.default_threshold   = j.value("default_threshold", c.default_threshold);
    c.default_limit       = readSize(j, "default_limit", c.default_limit);
    c.hit_rate_window     = readSize(j, "hit_rate_window", c.hit_rate_window);
    c.dimensions          = readSize(j, "dimensions", c.dimensions);
    c.warm_batch_size     = readSize(j, "warm_batch_size", c.warm_batch_size);
    c.integrity_check_enabled = j.value("integrity_check_enabled", c.integrity_check_enabled);
    c.max_recoverable_corruption_rate =
        j.value("max_recoverable_corruption_rate", c.max_recoverable_corruption_rate);
    c.verbose_logging     = j.value("verbose_logging", c.verbose_logging);

    if (j.contains("eviction_strategy")) {
        c.eviction_strategy = parseEvictionStrategy(j.at("eviction_strategy").get<std::string>());
    }
    if (j.contains("warm_timeout_ms")) {
        c.warm_timeout = std::chrono::milliseconds(j.at("warm_timeout_ms").get<int64_t>());
    }

    c.validate();
}
