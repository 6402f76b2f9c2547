#pragma once

/// @file frame_energy.h
/// @brief Frame cutting and energy accumulation for filtered pitch signals.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chromaflow {

/// @brief Nominal output frame rate of the filterbank in Hz.
constexpr float kFilterbankFeatureRate = 10.0f;

/// @brief Frame layout for one analysis frame at one canonical rate.
/// @details At the reference rate of 22050 Hz a frame spans 4410 samples (200 ms)
///          and frames start every 2205 samples (100 ms). Other rates scale these
///          lengths by rate / 22050 and by the tuning ratio. Hops are derived from
///          rounded frame start positions so they never drift.
struct FrameGeometry {
  int size;       ///< Frame length in samples
  int hop;        ///< Distance to the next frame start in samples
  int minimum;    ///< Samples required before the frame may be cut
  double factor;  ///< Energy scale, 22050 / rate

  /// @brief Computes the geometry of frame index `frame`.
  /// @param frame Frame index since the start of the stream
  /// @param rate Canonical sample rate in Hz
  /// @param tuning_ratio Nominal to effective input rate ratio
  /// @param drain If true, a partial frame of at least hop samples may be cut
  static FrameGeometry at(int64_t frame, int rate, double tuning_ratio, bool drain);
};

/// @brief Cuts every complete frame from the front of a filtered signal.
/// @param samples Filtered samples; consumed samples are erased from the front
/// @param frame_index Index of the next frame; advanced by the number of frames cut
/// @param rate Canonical sample rate of the signal
/// @param tuning_ratio Nominal to effective input rate ratio
/// @param drain If true, trailing frames shorter than the frame size are cut too
/// @param energies Receives one energy (scaled sum of squares) per frame cut
/// @return Number of frames cut
size_t cut_frames(std::vector<float>& samples, int64_t& frame_index, int rate,
                  double tuning_ratio, bool drain, std::vector<float>& energies);

}  // namespace chromaflow
