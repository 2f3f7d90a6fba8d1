// src/core/vector.hpp

#pragma once
#include <cstddef>
#include <initializer_list>
#include <vector>

class Vector {
private:
    std::vector<float> data;

public:
    Vector() = default;
    explicit Vector(size_t size);
    Vector(const std::vector<float>& values);
    Vector(std::initializer_list<float> values);
    float& operator[](size_t index);
    const float& operator[](size_t index) const;
    size_t size() const;
    bool empty() const { return data.empty(); }
    const float* data_ptr() const;
    float* data_ptr();
    const std::vector<float>& values() const { return data; }

    // Accumulates in double; throws std::invalid_argument on size mismatch.
    static double dot_product(const Vector& v1, const Vector& v2);
    double magnitude() const;
    bool is_finite() const;

    bool operator==(const Vector& other) const {
        return data == other.data;
    }
    bool operator!=(const Vector& other) const {
        return !(*this == other);
    }

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};
