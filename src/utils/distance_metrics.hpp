// src/utils/distance_metrics.hpp
#pragma once
#include <optional>

#include "../core/vector.hpp"

class CosineSimilarity {
public:
    // Normalized dot product clamped to [-1, 1]; nullopt when either vector has
    // zero magnitude (it cannot be normalized).
    static std::optional<float> similarity(const Vector& v1, const Vector& v2);

    // Same, with both norms already known.
    static std::optional<float> similarity(const Vector& v1, double norm1,
                                           const Vector& v2, double norm2);
};
