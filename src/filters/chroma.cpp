#include "filters/chroma.h"

#include <algorithm>
#include <cmath>

#include "core/convert.h"
#include "core/sample_rate.h"
#include "util/exception.h"

namespace chromaflow {

int hz_to_pitch_class(float hz, float tuning_hz) {
  if (hz <= 0.0f) {
    return -1;
  }
  int midi = static_cast<int>(std::round(hz_to_midi(hz, tuning_hz)));
  int pc = midi % 12;
  return pc < 0 ? pc + 12 : pc;
}

void fold_to_chroma(const float* pitch, float* chroma) {
  std::fill(chroma, chroma + kNumChroma, 0.0f);
  for (int p = 0; p < kNumPitches; ++p) {
    chroma[p % kNumChroma] += pitch[p];
  }
}

std::vector<float> fold_to_chroma(const float* pitch, size_t n_frames) {
  if (n_frames == 0) {
    return {};
  }
  CHROMAFLOW_CHECK(pitch != nullptr, ErrorCode::InvalidParameter);

  std::vector<float> chroma(n_frames * kNumChroma);
  for (size_t t = 0; t < n_frames; ++t) {
    fold_to_chroma(pitch + t * kNumPitches, chroma.data() + t * kNumChroma);
  }
  return chroma;
}

std::vector<int> create_bin_pitch_map(int sr, int n_fft, float tuning_hz) {
  CHROMAFLOW_CHECK(sr > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK(n_fft > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK(tuning_hz > 0.0f, ErrorCode::InvalidParameter);

  int n_bins = n_fft / 2 + 1;
  std::vector<int> map(n_bins, -1);

  // Skip DC bin
  for (int k = 1; k < n_bins; ++k) {
    float freq = bin_to_hz(k, sr, n_fft);
    int pitch = static_cast<int>(std::round(hz_to_midi(freq, tuning_hz)));
    if (pitch < 0) {
      continue;
    }
    if (pitch >= kNumPitches) {
      break;
    }
    map[k] = pitch;
  }

  return map;
}

std::vector<float> fold_bins_to_pitch(const float* bins, size_t n_frames, int n_bins,
                                      const std::vector<int>& bin_map) {
  CHROMAFLOW_CHECK(n_bins > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK(bin_map.size() == static_cast<size_t>(n_bins),
                   ErrorCode::ConfigurationMismatch);
  if (n_frames == 0) {
    return {};
  }
  CHROMAFLOW_CHECK(bins != nullptr, ErrorCode::InvalidParameter);

  std::vector<float> pitch(n_frames * kNumPitches, 0.0f);
  for (size_t t = 0; t < n_frames; ++t) {
    const float* frame = bins + t * n_bins;
    float* out = pitch.data() + t * kNumPitches;
    for (int k = 0; k < n_bins; ++k) {
      if (bin_map[k] >= 0) {
        out[bin_map[k]] += frame[k];
      }
    }
  }
  return pitch;
}

}  // namespace chromaflow
