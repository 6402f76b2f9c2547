/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <algorithm>

namespace chromaflow {

float max_value(const float* data, size_t size) {
  if (size == 0) return 0.0f;
  return *std::max_element(data, data + size);
}

}  // namespace chromaflow
