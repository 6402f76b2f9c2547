#pragma once

/// @file stft_pitch.h
/// @brief Windowed-FFT pitch extraction over a complete signal.

#include <cstddef>
#include <vector>

#include "core/window.h"
#include "feature/feature_buffer.h"
#include "util/types.h"

namespace chromaflow {

/// @brief What each FFT bin holds.
enum class BinRepresentation {
  Magnitude,  ///< |X[k]|
  Power,      ///< |X[k]|^2
};

/// @brief Configuration for STFT pitch extraction.
struct StftPitchConfig {
  int window_size = 4410;                               ///< Frame length in samples (even)
  int hop_size = 2205;                                  ///< Hop between frames in samples
  int sample_rate = 22050;                              ///< Rate of the input signal in Hz
  WindowType window = WindowType::Hann;                 ///< Analysis window
  BinRepresentation representation = BinRepresentation::Magnitude;
  bool zero_phase = true;                               ///< Rotate frame center to index 0
  float tuning_hz = 440.0f;                             ///< Frequency of A4 for bin mapping
  bool parallel = true;                                 ///< Compute frames on worker threads

  // Helper methods

  /// @brief Returns number of FFT bins.
  int n_bins() const { return window_size / 2 + 1; }

  /// @brief Returns frames per second.
  float feature_rate() const {
    return static_cast<float>(sample_rate) / static_cast<float>(hop_size);
  }

  /// @brief Returns the number of frames for a signal length.
  size_t n_frames(size_t n_samples) const;

  /// @brief Throws ChromaflowException with InvalidParameter if any field is invalid.
  void validate() const;
};

/// @brief Computes one bin vector per frame.
/// @param samples Signal at config.sample_rate
/// @param size Number of samples
/// @param config STFT configuration
/// @param progress Optional progress callback, called on the calling thread
/// @return ceil(size / hop_size) bin vectors of n_bins values; frames running past the
///         end of the signal are zero-filled
/// @throws ChromaflowException with OutOfMemory if the FFT cannot be allocated
std::vector<BinVector> compute_bin_vectors(const float* samples, size_t size,
                                           const StftPitchConfig& config,
                                           ProgressCallback progress = nullptr);

/// @brief Extracts 128-pitch vectors by folding FFT bins into pitches.
/// @param samples Signal at config.sample_rate
/// @param size Number of samples
/// @param config STFT configuration
/// @param progress Optional progress callback
/// @return Pitch buffer at config.feature_rate()
FeatureBuffer extract_stft_pitch(const float* samples, size_t size,
                                 const StftPitchConfig& config = StftPitchConfig(),
                                 ProgressCallback progress = nullptr);

}  // namespace chromaflow
