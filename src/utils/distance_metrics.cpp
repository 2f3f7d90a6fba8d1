#include "distance_metrics.hpp"

#include <algorithm>

std::optional<float> CosineSimilarity::similarity(const Vector& v1, const Vector& v2) {
    return similarity(v1, v1.magnitude(), v2, v2.magnitude());
}

std::optional<float> CosineSimilarity::similarity(const Vector& v1, double norm1,
                                                  const Vector& v2, double norm2) {
    if (norm1 == 0.0 || norm2 == 0.0) {
        return std::nullopt;
    }
    double cosine = Vector::dot_product(v1, v2) / (norm1 * norm2);
    return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}
