#pragma once

/// @file sample_rate.h
/// @brief The canonical sample-rate ladder of the pitch filterbank.

#include <array>
#include <cstddef>

namespace chromaflow {

/// @brief Number of canonical sample rates.
constexpr size_t kNumSampleRates = 5;

/// @brief Canonical sample rates in Hz, ascending.
constexpr std::array<int, kNumSampleRates> kSampleRates = {441, 882, 4410, 22050, 44100};

/// @brief Number of MIDI pitches covered by a pitch vector.
constexpr int kNumPitches = 128;

/// @brief Number of chroma bins.
constexpr int kNumChroma = 12;

/// @brief Inclusive pitch range bound to one canonical rate.
struct PitchRange {
  int first;  ///< Lowest pitch
  int last;   ///< Highest pitch (inclusive)

  bool contains(int pitch) const { return pitch >= first && pitch <= last; }
  int count() const { return last - first + 1; }
};

/// @brief Returns the ordinal position of a canonical rate in the ladder.
/// @param rate Sample rate in Hz
/// @return Index into kSampleRates
/// @throws ChromaflowException with UnsupportedSampleRate for non-ladder rates
size_t rate_index(int rate);

/// @brief Returns true if rate is one of the canonical rates.
bool is_canonical_rate(int rate);

/// @brief Snaps an arbitrary frequency to the nearest canonical rate.
/// @param hz Rate in Hz
/// @return Canonical rate
int nearest_sample_rate(double hz);

/// @brief Returns the canonical rate whose filters cover a pitch.
/// @param pitch MIDI pitch (0-127)
/// @return Sample rate in Hz
int sample_rate_for_pitch(int pitch);

/// @brief Returns the index of the canonical rate whose filters cover a pitch.
/// @param pitch MIDI pitch (0-127)
size_t rate_index_for_pitch(int pitch);

/// @brief Returns the pitch range served by a canonical rate.
/// @param rate Sample rate in Hz
/// @throws ChromaflowException with UnsupportedSampleRate for non-ladder rates
PitchRange pitch_range_for(int rate);

}  // namespace chromaflow
