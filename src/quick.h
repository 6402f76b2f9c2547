#pragma once

/// @file quick.h
/// @brief Simple function API for quick feature extraction.
/// @details Provides stateless functions for the common extraction tasks.
/// Each call builds a FeatureExtractor with default settings.

#include <cstddef>

#include "feature/chroma_features.h"
#include "feature/feature_buffer.h"

namespace chromaflow {
namespace quick {

/// @brief Extracts 10 Hz pitch features with the multirate filterbank.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz (one of kSampleRates)
/// @return Pitch buffer (128 dims)
FeatureBuffer pitch_features(const float* samples, size_t size, int sample_rate);

/// @brief Extracts chroma features with the multirate filterbank.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz (one of kSampleRates)
/// @param variant Chroma variant (default CP)
/// @return Chroma buffer (12 dims)
FeatureBuffer chroma_features(const float* samples, size_t size, int sample_rate,
                              const ChromaVariant& variant = ChromaVariant::cp());

}  // namespace quick
}  // namespace chromaflow
