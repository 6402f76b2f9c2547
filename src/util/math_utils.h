#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace chromaflow {

/// @brief Computes the sum of squares.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Sum of squared elements
template <typename T>
T sum_of_squares(const T* data, size_t size) {
  T sum_sq = T{0};
  for (size_t i = 0; i < size; ++i) {
    sum_sq += data[i] * data[i];
  }
  return sum_sq;
}

/// @brief Computes the L1 norm (sum of magnitudes).
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return L1 norm
template <typename T>
T norm_l1(const T* data, size_t size) {
  T sum = T{0};
  for (size_t i = 0; i < size; ++i) {
    sum += std::abs(data[i]);
  }
  return sum;
}

/// @brief Computes the L2 norm (Euclidean length).
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return L2 norm
template <typename T>
T norm_l2(const T* data, size_t size) {
  return std::sqrt(sum_of_squares(data, size));
}

/// @brief Integer division rounding up.
/// @param n Numerator (>= 0)
/// @param d Denominator (> 0)
inline size_t ceil_div(size_t n, size_t d) { return (n + d - 1) / d; }

/// @brief Rounds half away from zero and converts to int.
inline int round_to_int(double value) { return static_cast<int>(std::round(value)); }

/// @brief Returns the largest value in a buffer.
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Maximum value (0 if empty)
float max_value(const float* data, size_t size);

}  // namespace chromaflow
