/// @file feature_extractor.cpp
/// @brief Implementation of FeatureExtractor.

#include "analysis/feature_extractor.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/resample.h"
#include "streaming/pitch_filterbank.h"
#include "util/exception.h"

namespace chromaflow {

namespace {

/// @brief Samples handed to the filterbank per call.
constexpr size_t kFilterbankChunkSize = 44100;

/// @brief Share of progress reported by pitch extraction.
constexpr float kPitchProgressShare = 0.9f;

/// @brief Smoothing window used to bring pitch features to the chroma rate.
constexpr int kPitchSmoothingWindow = 21;

void append_vectors(FeatureBuffer& buffer, const std::vector<PitchVector>& vectors) {
  for (const auto& vector : vectors) {
    buffer.append(vector);
  }
}

}  // namespace

FeatureExtractor::FeatureExtractor(Recipe recipe) : recipe_(std::move(recipe)) {}

FeatureBuffer FeatureExtractor::extract_pitch(const float* samples, size_t size, int sample_rate,
                                              ProgressCallback progress) const {
  CHROMAFLOW_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);

  if (recipe_.method == PitchExtractionMethod::Stft) {
    const StftPitchConfig& stft = recipe_.stft;
    if (sample_rate == stft.sample_rate) {
      return extract_stft_pitch(samples, size, stft, progress);
    }
    std::vector<float> resampled = resample(samples, size, sample_rate, stft.sample_rate);
    return extract_stft_pitch(resampled.data(), resampled.size(), stft, progress);
  }

  FilterbankConfig config = recipe_.filterbank;
  config.sample_rate = sample_rate;
  PitchFilterbank filterbank(config);

  FeatureBuffer pitch = make_pitch_buffer(filterbank.feature_rate());
  for (size_t offset = 0; offset < size; offset += kFilterbankChunkSize) {
    size_t chunk = std::min(kFilterbankChunkSize, size - offset);
    append_vectors(pitch, filterbank.process(samples + offset, chunk));
    if (progress) {
      progress(static_cast<float>(offset + chunk) / static_cast<float>(size));
    }
  }
  append_vectors(pitch, filterbank.drain());
  if (progress && size == 0) {
    progress(1.0f);
  }

  return pitch;
}

Features FeatureExtractor::extract(const float* samples, size_t size, int sample_rate,
                                   ProgressCallback progress) const {
  ProgressCallback pitch_progress;
  if (progress) {
    pitch_progress = [&progress](float p) { progress(p * kPitchProgressShare); };
  }

  Features features;
  features.pitch.method = recipe_.method;
  features.pitch.filters = recipe_.filters;
  features.pitch.buffer =
      apply_chain(extract_pitch(samples, size, sample_rate, pitch_progress), recipe_.filters);

  features.chroma.variant = recipe_.chroma_variant;
  features.chroma.buffer = extract_chroma(features.pitch.buffer, recipe_.chroma_variant);

  float pitch_rate = features.pitch.feature_rate();
  float chroma_rate = features.chroma.feature_rate();
  if (pitch_rate == chroma_rate) {
    features.smoothed_pitch = features.pitch;
  } else {
    SmoothingSettings smoothing;
    smoothing.window_size = kPitchSmoothingWindow;
    smoothing.downsample_factor =
        std::max(1, static_cast<int>(std::round(pitch_rate / chroma_rate)));

    features.smoothed_pitch.method = recipe_.method;
    features.smoothed_pitch.filters = recipe_.filters;
    features.smoothed_pitch.filters.push_back(FeatureFilter::make(smoothing));
    features.smoothed_pitch.buffer = smooth(features.pitch.buffer, smoothing);
  }

  if (progress) {
    progress(1.0f);
  }
  return features;
}

}  // namespace chromaflow
