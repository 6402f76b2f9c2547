/// @file pitch_filterbank.cpp
/// @brief Implementation of the streaming pitch filterbank.

#include "streaming/pitch_filterbank.h"

#include <algorithm>
#include <string>

#include "filters/pitch_filter_table.h"
#include "util/exception.h"
#include "util/parallel.h"

namespace chromaflow {

PitchFilterbank::PitchFilterbank(const FilterbankConfig& config) : config_(config) {
  CHROMAFLOW_CHECK_MSG(is_canonical_rate(config_.sample_rate), ErrorCode::UnsupportedSampleRate,
                       "Unsupported input sample rate: " + std::to_string(config_.sample_rate));
  CHROMAFLOW_CHECK_MSG(config_.tuning_hz > 0.0f, ErrorCode::InvalidParameter,
                       "Tuning frequency must be positive");
  CHROMAFLOW_CHECK_MSG(config_.min_pitch >= 0 && config_.max_pitch < kNumPitches &&
                           config_.min_pitch <= config_.max_pitch,
                       ErrorCode::InvalidParameter, "Invalid pitch range");
  CHROMAFLOW_CHECK_MSG(config_.resampler_block_size > 0, ErrorCode::InvalidParameter,
                       "Resampler block size must be positive");

  effective_input_rate_ = config_.effective_input_rate();
  tuning_ratio_ = config_.tuning_ratio();

  rate_in_use_.fill(false);
  filters_.resize(kNumPitches);
  group_delays_.fill(0);

  for (int p = config_.min_pitch; p <= config_.max_pitch; ++p) {
    const PitchFilterSpec& spec = pitch_filter_spec(p);
    if (spec.empty()) {
      continue;
    }
    pitches_.push_back(p);
    rate_in_use_[rate_index_for_pitch(p)] = true;
    filters_[p] = IIRFilter(std::vector<double>(spec.b.begin(), spec.b.begin() + spec.taps),
                            std::vector<double>(spec.a.begin(), spec.a.begin() + spec.taps));
    group_delays_[p] = spec.group_delay;
  }
  CHROMAFLOW_CHECK_MSG(!pitches_.empty(), ErrorCode::InvalidParameter,
                       "Pitch range contains no filtered pitches");

  // Every frame must advance by at least one sample at every rate in use
  for (size_t r = 0; r < kNumSampleRates; ++r) {
    if (!rate_in_use_[r]) continue;
    FrameGeometry geometry = FrameGeometry::at(0, kSampleRates[r], tuning_ratio_, false);
    CHROMAFLOW_CHECK_MSG(geometry.hop > 0 && geometry.size > 0, ErrorCode::InvalidParameter,
                         "Tuning frequency yields empty analysis frames");
  }

  resamplers_.reserve(kNumSampleRates);
  for (int rate : kSampleRates) {
    resamplers_.emplace_back(effective_input_rate_, rate, config_.resampler_block_size);
  }

  reset();
}

PitchFilterbank::~PitchFilterbank() = default;
PitchFilterbank::PitchFilterbank(PitchFilterbank&&) noexcept = default;
PitchFilterbank& PitchFilterbank::operator=(PitchFilterbank&&) noexcept = default;

void PitchFilterbank::reset() {
  for (auto& resampler : resamplers_) {
    resampler.reset();
  }
  for (auto& filter : filters_) {
    filter.reset();
  }
  for (auto& signal : resampled_) {
    signal.clear();
  }
  for (auto& signal : filtered_) {
    signal.clear();
  }
  for (auto& energy : energies_) {
    energy.clear();
  }
  to_compensate_.fill(0);
  frame_index_.fill(0);

  mode_ = InputMode::None;
  external_latency_ = 0;
  block_count_ = 0;
  drained_ = false;
}

int PitchFilterbank::pending_latency(int pitch) const {
  CHROMAFLOW_CHECK(pitch >= 0 && pitch < kNumPitches, ErrorCode::InvalidParameter);
  return to_compensate_[pitch];
}

int PitchFilterbank::resampler_latency(int rate) const {
  return resamplers_[rate_index(rate)].output_latency();
}

bool PitchFilterbank::covers(int pitch) const {
  return std::binary_search(pitches_.begin(), pitches_.end(), pitch);
}

void PitchFilterbank::begin_stream(InputMode mode, int external_latency) {
  CHROMAFLOW_CHECK_MSG(!drained_, ErrorCode::InvalidState,
                       "Filterbank has been drained; call reset() first");

  if (mode_ == InputMode::None) {
    // Latency counters are loaded once per stream
    mode_ = mode;
    external_latency_ = external_latency;
    for (int p : pitches_) {
      int latency = mode == InputMode::Multirate
                        ? external_latency
                        : resamplers_[rate_index_for_pitch(p)].output_latency();
      to_compensate_[p] = latency + group_delays_[p];
    }
    return;
  }

  CHROMAFLOW_CHECK_MSG(mode_ == mode, ErrorCode::InvalidState,
                       "Cannot mix resampled and multirate input in one stream");
}

void PitchFilterbank::resample_input(const float* samples, size_t size, bool flush) {
  parallel_for(
      kNumSampleRates,
      [&](size_t r) {
        resampled_[r].clear();
        if (!rate_in_use_[r]) return;
        if (flush) {
          resamplers_[r].flush(resampled_[r]);
        } else {
          resamplers_[r].process(samples, size, resampled_[r]);
        }
      },
      config_.parallel);
}

std::vector<PitchVector> PitchFilterbank::process(const float* samples, size_t size) {
  begin_stream(InputMode::Internal, 0);
  CHROMAFLOW_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);

  resample_input(samples, size, false);
  return filter_and_emit(false);
}

std::vector<PitchVector> PitchFilterbank::process_multirate(const MultirateBlock& block) {
  CHROMAFLOW_CHECK_MSG(block.latency >= 0, ErrorCode::InvalidParameter,
                       "Multirate latency must not be negative");
  begin_stream(InputMode::Multirate, block.latency);

  for (size_t r = 0; r < kNumSampleRates; ++r) {
    resampled_[r] = block.signals[r];
  }
  return filter_and_emit(false);
}

std::vector<PitchVector> PitchFilterbank::drain() {
  // A stream with no input still drains cleanly
  begin_stream(mode_ == InputMode::None ? InputMode::Internal : mode_, 0);

  if (mode_ == InputMode::Multirate) {
    for (size_t r = 0; r < kNumSampleRates; ++r) {
      resampled_[r].assign(static_cast<size_t>(external_latency_), 0.0f);
    }
  } else {
    resample_input(nullptr, 0, true);
  }

  std::vector<PitchVector> out = filter_and_emit(true);
  drained_ = true;
  return out;
}

std::vector<PitchVector> PitchFilterbank::filter_and_emit(bool drain) {
  const size_t n_pitches = pitches_.size();

  // Filter each pitch at its rate and drop transient samples
  parallel_for(
      n_pitches,
      [&](size_t i) {
        int p = pitches_[i];
        const std::vector<float>& input = resampled_[rate_index_for_pitch(p)];

        std::vector<float> output(input.size() + (drain ? group_delays_[p] : 0), 0.0f);
        filters_[p].process(input.data(), input.size(), output.data());
        if (drain && group_delays_[p] > 0) {
          // Zero padding pushes the filter's delayed tail out
          std::vector<float> zeros(static_cast<size_t>(group_delays_[p]), 0.0f);
          filters_[p].process(zeros.data(), zeros.size(), output.data() + input.size());
        }

        size_t skip = std::min(output.size(), static_cast<size_t>(to_compensate_[p]));
        to_compensate_[p] -= static_cast<int>(skip);

        filtered_[p].insert(filtered_[p].end(), output.begin() + static_cast<std::ptrdiff_t>(skip),
                            output.end());
      },
      config_.parallel);

  // Cut frames per pitch into private slots, then merge in one pass
  std::vector<std::vector<float>> new_energies(n_pitches);
  parallel_for(
      n_pitches,
      [&](size_t i) {
        int p = pitches_[i];
        int rate = sample_rate_for_pitch(p);
        cut_frames(filtered_[p], frame_index_[p], rate, tuning_ratio_, drain, new_energies[i]);
      },
      config_.parallel);

  for (size_t i = 0; i < n_pitches; ++i) {
    auto& energies = energies_[pitches_[i]];
    energies.insert(energies.end(), new_energies[i].begin(), new_energies[i].end());
  }
  ++block_count_;

  // Align columns across pitches: min while streaming, max when draining
  size_t n_columns = energies_[pitches_.front()].size();
  for (int p : pitches_) {
    n_columns = drain ? std::max(n_columns, energies_[p].size())
                      : std::min(n_columns, energies_[p].size());
  }

  std::vector<PitchVector> out(n_columns);
  for (auto& vector : out) {
    vector.fill(0.0f);
  }
  for (int p : pitches_) {
    auto& energies = energies_[p];
    size_t available = std::min(n_columns, energies.size());
    for (size_t c = 0; c < available; ++c) {
      out[c][p] = energies[c];
    }
    energies.erase(energies.begin(), energies.begin() + static_cast<std::ptrdiff_t>(available));
  }

  return out;
}

}  // namespace chromaflow
