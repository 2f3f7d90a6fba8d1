#include <cmath>
#include <stdexcept>
#include <vector>

#include "vector.hpp"

Vector::Vector(size_t size) : data(size) {}

Vector::Vector(const std::vector<float>& values) : data(values) {}

Vector::Vector(std::initializer_list<float> values) : data(values) {}

float& Vector::operator[](size_t index) {
    if (index >= data.size()) {
        throw std::out_of_range("Index out of range");
    }
    return data[index];
}

const float& Vector::operator[](size_t index) const {
    if (index >= data.size()) {
        throw std::out_of_range("Index out of range");
    }
    return data[index];
}

size_t Vector::size() const {
    return data.size();
}

const float* Vector::data_ptr() const {
    return data.data();
}

float* Vector::data_ptr() {
    return data.data();
}

double Vector::dot_product(const Vector& v1, const Vector& v2) {
    if (v1.size() != v2.size()) {
        throw std::invalid_argument("Vectors must be the same size");
    }

    double result = 0.0;
    const float* a = v1.data_ptr();
    const float* b = v2.data_ptr();
    for (size_t i = 0; i < v1.size(); ++i) {
        result += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return result;
}

double Vector::magnitude() const {
    return std::sqrt(dot_product(*this, *this));
}

bool Vector::is_finite() const {
    for (float x : data) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}
