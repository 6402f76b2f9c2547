#pragma once

/// @file normalization.h
/// @brief Max-value and lp-norm normalization of feature vectors.

#include <cstddef>

#include "feature/feature_buffer.h"

namespace chromaflow {

/// @brief Norm used by lp normalization.
enum class NormSpace {
  L1,  ///< Sum of magnitudes
  L2,  ///< Euclidean length
};

/// @brief Normalization method.
enum class NormalizationMode {
  MaxValue,  ///< Divide the whole buffer by its largest value
  LpNorm,    ///< Divide each vector by its own lp norm
};

/// @brief Settings for normalization.
struct NormalizationSettings {
  NormalizationMode mode = NormalizationMode::LpNorm;
  NormSpace space = NormSpace::L2;  ///< Used by LpNorm only
  float threshold = 0.001f;         ///< Norms below this yield the uniform unit vector

  /// @brief Max-value normalization.
  static NormalizationSettings max_value() {
    NormalizationSettings settings;
    settings.mode = NormalizationMode::MaxValue;
    return settings;
  }

  /// @brief lp-norm normalization.
  static NormalizationSettings lp_norm(NormSpace space, float threshold) {
    NormalizationSettings settings;
    settings.mode = NormalizationMode::LpNorm;
    settings.space = space;
    settings.threshold = threshold;
    return settings;
  }
};

/// @brief Computes the lp norm of a vector.
/// @param data Vector values
/// @param size Number of values
/// @param space Norm to compute
float lp_norm(const float* data, size_t size, NormSpace space);

/// @brief Normalizes one vector in place by its lp norm.
/// @param data Vector values
/// @param size Number of values
/// @param space Norm to use
/// @param threshold Norms below this replace the vector with 1/N (l1) or 1/sqrt(N) (l2)
void normalize_vector(float* data, size_t size, NormSpace space, float threshold);

/// @brief Normalizes every frame of a buffer in place.
/// @param buffer Buffer to normalize
/// @param settings Normalization settings
/// @details Max-value normalization of a buffer whose largest value is not positive
///          leaves the buffer unchanged.
void normalize(FeatureBuffer& buffer, const NormalizationSettings& settings = {});

}  // namespace chromaflow
