#pragma once

/// @file feature_extractor.h
/// @brief One-shot pitch and chroma feature extraction from a decoded signal.

#include <cstddef>
#include <vector>

#include "feature/chroma_features.h"
#include "feature/feature_buffer.h"
#include "feature/feature_filter.h"
#include "feature/stft_pitch.h"
#include "streaming/filterbank_config.h"
#include "util/types.h"

namespace chromaflow {

/// @brief How pitch vectors are computed from samples.
enum class PitchExtractionMethod {
  Filterbank,  ///< Streaming multirate IIR filterbank
  Stft,        ///< Windowed FFT with bins folded into pitches
};

/// @brief Complete description of a feature extraction run.
struct Recipe {
  PitchExtractionMethod method = PitchExtractionMethod::Filterbank;
  FilterbankConfig filterbank;          ///< Used by Filterbank (sample_rate is taken from input)
  StftPitchConfig stft;                 ///< Used by Stft
  std::vector<FeatureFilter> filters;   ///< Applied to the pitch buffer in order
  ChromaVariant chroma_variant;         ///< How chroma is derived from pitch

  /// @brief Filterbank extraction, no pitch filters, default CP chroma.
  static Recipe default_recipe() { return Recipe(); }
};

/// @brief Pitch buffer plus the settings that produced it.
struct PitchFeatures {
  FeatureBuffer buffer;
  PitchExtractionMethod method = PitchExtractionMethod::Filterbank;
  std::vector<FeatureFilter> filters;

  float feature_rate() const { return buffer.feature_rate(); }
};

/// @brief Chroma buffer plus the variant that produced it.
struct ChromaFeatures {
  FeatureBuffer buffer;
  ChromaVariant variant;

  float feature_rate() const { return buffer.feature_rate(); }
};

/// @brief Result of a feature extraction run.
struct Features {
  PitchFeatures pitch;           ///< Filtered pitch features
  PitchFeatures smoothed_pitch;  ///< Pitch features at the chroma feature rate
  ChromaFeatures chroma;         ///< Chroma features
};

/// @brief Runs a Recipe over complete decoded signals.
class FeatureExtractor {
 public:
  /// @brief Constructs an extractor.
  /// @param recipe Extraction recipe
  explicit FeatureExtractor(Recipe recipe = Recipe::default_recipe());

  /// @brief Extracts pitch, smoothed pitch and chroma features.
  /// @param samples Mono samples
  /// @param size Number of samples
  /// @param sample_rate Rate of samples in Hz
  /// @param progress Optional progress callback (0, 1]
  /// @return Features
  /// @throws ChromaflowException with UnsupportedSampleRate if the filterbank method
  ///         is used with a non-canonical rate
  Features extract(const float* samples, size_t size, int sample_rate,
                   ProgressCallback progress = nullptr) const;

  /// @brief Extracts the unfiltered pitch buffer.
  FeatureBuffer extract_pitch(const float* samples, size_t size, int sample_rate,
                              ProgressCallback progress = nullptr) const;

  /// @brief Returns the recipe.
  const Recipe& recipe() const { return recipe_; }

 private:
  Recipe recipe_;
};

}  // namespace chromaflow
