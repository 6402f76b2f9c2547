#pragma once

/// @file quantization.h
/// @brief Step quantization of feature values.

#include <cstddef>
#include <vector>

#include "feature/feature_buffer.h"

namespace chromaflow {

/// @brief Ascending step thresholds with one weight per step.
/// @details A value maps to the sum of the weights of every step it meets or exceeds.
class QuantizationSettings {
 public:
  /// @brief Default steps {0.05, 0.1, 0.2, 0.4} with weights 0.25 each.
  QuantizationSettings();

  /// @brief Constructs settings from steps and weights.
  /// @param steps Step thresholds (any order, sorted on construction)
  /// @param weights Weight for each step, reordered alongside the steps
  /// @throws ChromaflowException with ConfigurationMismatch if the lengths differ
  /// @throws ChromaflowException with InvalidParameter if a weight is negative
  QuantizationSettings(std::vector<float> steps, std::vector<float> weights);

  const std::vector<float>& steps() const { return steps_; }
  const std::vector<float>& weights() const { return weights_; }

 private:
  std::vector<float> steps_;
  std::vector<float> weights_;
};

/// @brief Quantizes a single value.
float quantize_value(float value, const QuantizationSettings& settings);

/// @brief Quantizes values in place.
void quantize(float* data, size_t size, const QuantizationSettings& settings);

/// @brief Quantizes every frame of a buffer in place.
void quantize(FeatureBuffer& buffer, const QuantizationSettings& settings = {});

}  // namespace chromaflow
