#pragma once

/// @file compression.h
/// @brief Logarithmic compression of feature values.

#include <cstddef>

#include "feature/feature_buffer.h"

namespace chromaflow {

/// @brief Settings for y = log10(factor * x + term).
struct CompressionSettings {
  float term = 1.0f;      ///< Added before the logarithm (> 0 keeps silence finite)
  float factor = 100.0f;  ///< Scales values before the logarithm
};

/// @brief Compresses values in place.
/// @param data Values to compress
/// @param size Number of values
/// @param settings Compression settings
void compress(float* data, size_t size, const CompressionSettings& settings = {});

/// @brief Compresses every frame of a buffer in place.
void compress(FeatureBuffer& buffer, const CompressionSettings& settings = {});

}  // namespace chromaflow
