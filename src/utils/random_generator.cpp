// src/utils/random_generator.cpp

#include "random_generator.hpp"

#include <algorithm>
#include <numeric>

RandomGenerator::RandomGenerator(unsigned int seed) : gen(seed) {}

Vector RandomGenerator::generateUniformVector(size_t dimensions, float min, float max) {
    Vector v(dimensions);
    std::uniform_real_distribution<float> dist(min, max);
    for (size_t i = 0; i < dimensions; ++i) {
        v[i] = dist(gen);
    }
    return v;
}

Vector RandomGenerator::generateNormalVector(size_t dimensions, float mean, float stddev) {
    Vector v(dimensions);
    std::normal_distribution<float> dist(mean, stddev);
    for (size_t i = 0; i < dimensions; ++i) {
        v[i] = dist(gen);
    }
    return v;
}

std::vector<size_t> RandomGenerator::permutation(size_t n) {
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::shuffle(order.begin(), order.end(), gen);
    return order;
}
