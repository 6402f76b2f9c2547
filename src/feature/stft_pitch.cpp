#include "feature/stft_pitch.h"

#include <algorithm>

#include "core/fft.h"
#include "filters/chroma.h"
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/parallel.h"

namespace chromaflow {

namespace {

/// @brief Frames computed between progress reports.
constexpr size_t kProgressBatch = 64;

/// @brief Window coefficients sum to this value.
constexpr float kWindowSum = 2.0f;

}  // namespace

size_t StftPitchConfig::n_frames(size_t n_samples) const {
  if (hop_size <= 0) return 0;
  return ceil_div(n_samples, static_cast<size_t>(hop_size));
}

void StftPitchConfig::validate() const {
  CHROMAFLOW_CHECK_MSG(window_size > 0 && window_size % 2 == 0, ErrorCode::InvalidParameter,
                       "STFT window size must be even and positive");
  CHROMAFLOW_CHECK_MSG(hop_size > 0, ErrorCode::InvalidParameter,
                       "STFT hop size must be positive");
  CHROMAFLOW_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                       "STFT sample rate must be positive");
  CHROMAFLOW_CHECK_MSG(tuning_hz > 0.0f, ErrorCode::InvalidParameter,
                       "Tuning frequency must be positive");
}

std::vector<BinVector> compute_bin_vectors(const float* samples, size_t size,
                                           const StftPitchConfig& config,
                                           ProgressCallback progress) {
  config.validate();
  if (size == 0) {
    return {};
  }
  CHROMAFLOW_CHECK(samples != nullptr, ErrorCode::InvalidParameter);

  const size_t window_size = static_cast<size_t>(config.window_size);
  const size_t hop = static_cast<size_t>(config.hop_size);
  const size_t n_frames = config.n_frames(size);
  const bool squared = config.representation == BinRepresentation::Power;

  std::vector<float> window = create_window(config.window, config.window_size);
  scale_to_sum(window, kWindowSum);

  std::vector<BinVector> frames(n_frames, BinVector(static_cast<size_t>(config.n_bins())));

  for (size_t batch_start = 0; batch_start < n_frames; batch_start += kProgressBatch) {
    size_t batch_end = std::min(n_frames, batch_start + kProgressBatch);
    size_t batch_size = batch_end - batch_start;
    size_t n_slices = config.parallel ? parallel_worker_count(batch_size) : 1;

    // One FFT per slice; an FFT instance is not shareable across threads
    parallel_for(
        n_slices,
        [&](size_t slice) {
          FFT fft(config.window_size);
          std::vector<float> frame(window_size);
          for (size_t t = batch_start + slice; t < batch_end; t += n_slices) {
            size_t start = t * hop;
            size_t available = start < size ? std::min(window_size, size - start) : 0;
            std::fill(frame.begin(), frame.end(), 0.0f);
            for (size_t i = 0; i < available; ++i) {
              frame[i] = samples[start + i] * window[i];
            }
            if (config.zero_phase) {
              apply_zero_phase(frame);
            }
            fft.magnitude(frame.data(), frames[t].data(), squared);
          }
        },
        config.parallel);

    if (progress) {
      progress(static_cast<float>(batch_end) / static_cast<float>(n_frames));
    }
  }

  return frames;
}

FeatureBuffer extract_stft_pitch(const float* samples, size_t size,
                                 const StftPitchConfig& config, ProgressCallback progress) {
  std::vector<BinVector> bins = compute_bin_vectors(samples, size, config, progress);
  std::vector<int> bin_map =
      create_bin_pitch_map(config.sample_rate, config.window_size, config.tuning_hz);

  FeatureBuffer pitch = make_pitch_buffer(config.feature_rate());
  for (const auto& frame : bins) {
    std::vector<float> folded = fold_bins_to_pitch(frame.data(), 1, config.n_bins(), bin_map);
    pitch.append(folded.data());
  }
  return pitch;
}

}  // namespace chromaflow
