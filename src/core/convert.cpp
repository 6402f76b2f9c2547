/// @file convert.cpp
/// @brief Implementation of unit conversion functions.

#include "core/convert.h"

#include <cmath>

#include "util/exception.h"
#include "util/types.h"

namespace chromaflow {

float hz_to_midi(float hz, float tuning_hz) {
  if (hz <= 0) return 0.0f;
  return 12.0f * std::log2(hz / tuning_hz) + 69.0f;
}

float midi_to_hz(float midi, float tuning_hz) {
  return tuning_hz * std::pow(2.0f, (midi - 69.0f) / 12.0f);
}

double pitch_center_frequency(int pitch, double tuning_hz) {
  return tuning_hz * std::pow(2.0, (pitch - 69) / 12.0);
}

std::string pitch_name(int pitch) {
  CHROMAFLOW_CHECK(pitch >= 0 && pitch < 128, ErrorCode::InvalidParameter);
  int octave = pitch / 12 - 1;
  return std::string(pitch_class_name(static_cast<PitchClass>(pitch % 12))) +
         std::to_string(octave);
}

std::string hz_to_note(float hz) {
  if (hz <= 0) return "?";

  int midi = static_cast<int>(std::round(hz_to_midi(hz)));
  if (midi < 0 || midi > 127) return "?";
  return pitch_name(midi);
}

float bin_to_hz(int bin, int sr, int n_fft) { return static_cast<float>(bin) * sr / n_fft; }

float frame_to_time(int frame, float feature_rate) {
  if (feature_rate <= 0.0f) return 0.0f;
  return static_cast<float>(frame) / feature_rate;
}

}  // namespace chromaflow
