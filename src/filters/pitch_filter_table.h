#pragma once

/// @file pitch_filter_table.h
/// @brief Fixed band-pass coefficient and group-delay table for the 128 pitch filters.

#include <array>
#include <cstddef>

namespace chromaflow {

/// @brief Version of the coefficient table. Bump when any coefficient changes.
constexpr int kPitchFilterTableVersion = 1;

/// @brief Largest coefficient count of any pitch filter.
constexpr size_t kMaxPitchFilterTaps = 11;

/// @brief Band-pass design for one MIDI pitch.
/// @details Pitches outside the designed range have taps == 0 and must be skipped.
struct PitchFilterSpec {
  size_t taps;                                ///< Number of coefficients in b and a (order + 1)
  std::array<double, kMaxPitchFilterTaps> b;  ///< Feed-forward coefficients
  std::array<double, kMaxPitchFilterTaps> a;  ///< Feedback coefficients, a[0] == 1
  int group_delay;                            ///< Group delay in samples at the pitch's rate

  bool empty() const { return taps == 0; }
};

/// @brief Returns the filter design for a MIDI pitch.
/// @param pitch MIDI pitch (0-127)
/// @throws ChromaflowException with InvalidParameter if pitch is out of range
const PitchFilterSpec& pitch_filter_spec(int pitch);

}  // namespace chromaflow
