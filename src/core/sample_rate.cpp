/// @file sample_rate.cpp
/// @brief Implementation of the canonical sample-rate ladder.

#include "core/sample_rate.h"

#include <string>

#include "util/exception.h"

namespace chromaflow {

namespace {

// Pitch ranges per rate, matching the passbands the filter table was designed for.
constexpr std::array<PitchRange, kNumSampleRates> kPitchRanges = {{
    {0, 20},
    {21, 59},
    {60, 95},
    {96, 120},
    {121, 127},
}};

}  // namespace

size_t rate_index(int rate) {
  for (size_t i = 0; i < kNumSampleRates; ++i) {
    if (kSampleRates[i] == rate) {
      return i;
    }
  }
  throw ChromaflowException(ErrorCode::UnsupportedSampleRate,
                            "Unsupported canonical sample rate: " + std::to_string(rate));
}

bool is_canonical_rate(int rate) {
  for (int r : kSampleRates) {
    if (r == rate) return true;
  }
  return false;
}

int nearest_sample_rate(double hz) {
  if (hz < 662.0) return 441;
  if (hz < 2646.0) return 882;
  if (hz < 13230.0) return 4410;
  if (hz < 33075.0) return 22050;
  return 44100;
}

size_t rate_index_for_pitch(int pitch) {
  CHROMAFLOW_CHECK_MSG(pitch >= 0 && pitch < kNumPitches, ErrorCode::InvalidParameter,
                       "Pitch out of range: " + std::to_string(pitch));
  for (size_t i = 0; i < kNumSampleRates; ++i) {
    if (kPitchRanges[i].contains(pitch)) {
      return i;
    }
  }
  return kNumSampleRates - 1;
}

int sample_rate_for_pitch(int pitch) { return kSampleRates[rate_index_for_pitch(pitch)]; }

PitchRange pitch_range_for(int rate) { return kPitchRanges[rate_index(rate)]; }

}  // namespace chromaflow
