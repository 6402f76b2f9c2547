#pragma once

/// @file smoothing.h
/// @brief Temporal smoothing and downsampling of feature buffers.

#include "feature/feature_buffer.h"

namespace chromaflow {

/// @brief Settings for smoothing.
struct SmoothingSettings {
  int window_size = 21;       ///< Hann low-pass length in frames (1 disables filtering)
  int downsample_factor = 5;  ///< Keep every n-th filtered frame (1 preserves the rate)
};

/// @brief Low-pass filters every vector dimension over time and decimates.
/// @param buffer Input frames
/// @param settings Smoothing settings
/// @return ceil(n_frames / downsample_factor) frames at feature_rate / downsample_factor,
///         each l2-normalized with threshold 0.001
/// @throws ChromaflowException with InvalidParameter for non-positive settings
/// @details Each dimension is treated as its own channel and zero-padded at the end
///          by window_size - 1 frames. Output frame n is sum_k x[n * factor + k] * w[k].
FeatureBuffer smooth(const FeatureBuffer& buffer, const SmoothingSettings& settings = {});

}  // namespace chromaflow
