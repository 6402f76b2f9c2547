#pragma once

/// @file decibel.h
/// @brief Decibel conversion of feature values.

#include <cstddef>

#include "feature/feature_buffer.h"

namespace chromaflow {

/// @brief Decibel scale multiplier.
enum class DecibelScale {
  Power = 10,      ///< 10 * log10(x / ref)
  Amplitude = 20,  ///< 20 * log10(x / ref)
};

/// @brief Settings for decibel conversion.
struct DecibelSettings {
  DecibelScale scale = DecibelScale::Power;
  float zero_reference = 1.0f;  ///< Value mapped to 0 dB (> 0)

  /// @brief Returns the numeric multiplier (10 or 20).
  float multiplier() const { return static_cast<float>(static_cast<int>(scale)); }
};

/// @brief Smallest ratio to the reference converted; keeps silence finite.
constexpr float kDecibelFloor = 1e-10f;

/// @brief Converts values to decibels in place.
/// @param data Values to convert
/// @param size Number of values
/// @param settings Conversion settings
/// @throws ChromaflowException with InvalidParameter if zero_reference <= 0
void to_decibels(float* data, size_t size, const DecibelSettings& settings = {});

/// @brief Converts every frame of a buffer to decibels in place.
void to_decibels(FeatureBuffer& buffer, const DecibelSettings& settings = {});

}  // namespace chromaflow
