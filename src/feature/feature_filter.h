#pragma once

/// @file feature_filter.h
/// @brief One configurable step of a feature filter chain.

#include <string>
#include <vector>

#include "feature/compression.h"
#include "feature/decibel.h"
#include "feature/feature_buffer.h"
#include "feature/normalization.h"
#include "feature/quantization.h"
#include "feature/smoothing.h"

namespace chromaflow {

/// @brief Kind of feature filter step.
enum class FeatureFilterType {
  Compression,
  Normalization,
  Quantization,
  Smoothing,
  Decibel,
};

/// @brief A filter chain step: its kind plus the settings for that kind.
/// @details Only the settings member matching type is used.
struct FeatureFilter {
  FeatureFilterType type = FeatureFilterType::Normalization;
  CompressionSettings compression;
  NormalizationSettings normalization;
  QuantizationSettings quantization;
  SmoothingSettings smoothing;
  DecibelSettings decibel;

  static FeatureFilter make(const CompressionSettings& settings);
  static FeatureFilter make(const NormalizationSettings& settings);
  static FeatureFilter make(const QuantizationSettings& settings);
  static FeatureFilter make(const SmoothingSettings& settings);
  static FeatureFilter make(const DecibelSettings& settings);
};

/// @brief Applies one filter step.
/// @param buffer Input buffer
/// @param filter Step to apply
/// @return Filtered buffer (smoothing may change frame count and feature rate)
FeatureBuffer apply_filter(FeatureBuffer buffer, const FeatureFilter& filter);

/// @brief Applies filter steps in order.
/// @param buffer Input buffer
/// @param filters Ordered steps
/// @return Filtered buffer
FeatureBuffer apply_chain(FeatureBuffer buffer, const std::vector<FeatureFilter>& filters);

/// @brief Returns a one-line description of a filter step.
/// @details For example "Compression (term: 1, factor: 100)".
std::string describe(const FeatureFilter& filter);

}  // namespace chromaflow
