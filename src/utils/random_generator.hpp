#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "../core/vector.hpp"

class RandomGenerator {
private:
    std::mt19937 gen;

public:
    explicit RandomGenerator(unsigned int seed = std::random_device{}());
    Vector generateUniformVector(size_t dimensions, float min = 0.0f, float max = 1.0f);
    Vector generateNormalVector(size_t dimensions, float mean = 0.0f, float stddev = 1.0f);

    // Uniformly random ordering of [0, n).
    std::vector<size_t> permutation(size_t n);
};
