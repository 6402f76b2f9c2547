#pragma once

/// @file pitch_filterbank.h
/// @brief Streaming multirate pitch filterbank.

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/resample.h"
#include "core/sample_rate.h"
#include "feature/feature_buffer.h"
#include "filters/iir.h"
#include "streaming/filterbank_config.h"
#include "streaming/frame_energy.h"

namespace chromaflow {

/// @brief Input already resampled to every canonical rate by the caller.
struct MultirateBlock {
  /// @brief Samples per canonical rate, indexed by rate_index().
  std::array<std::vector<float>, kNumSampleRates> signals;

  /// @brief Transient samples (at each rate) the caller's resampling introduced.
  int latency = 546;
};

/// @brief Streaming 128-band pitch filterbank.
/// @details Resamples the input to five canonical rates, band-pass filters every
/// covered pitch at its rate, drops each pitch's transient start-up samples, cuts
/// 200 ms frames every 100 ms and emits one 128-value energy vector per frame.
///
/// Usage:
/// @code
///   PitchFilterbank filterbank(config);
///   while (decoder.read(chunk)) {
///     for (const auto& v : filterbank.process(chunk.data(), chunk.size())) consume(v);
///   }
///   for (const auto& v : filterbank.drain()) consume(v);
/// @endcode
///
/// Thread Safety: calls on one instance must be serialized. Work inside a call is
/// spread across threads when config.parallel is set. Each process() call starts and
/// joins fresh worker threads for its resampling, filtering and framing stages, so
/// feed chunks of several thousand samples, or disable config.parallel when chunks
/// are small.
class PitchFilterbank {
 public:
  /// @brief Constructs a filterbank.
  /// @param config Filterbank configuration
  /// @throws ChromaflowException with UnsupportedSampleRate if sample_rate is not canonical
  /// @throws ChromaflowException with InvalidParameter for an invalid tuning or pitch range
  explicit PitchFilterbank(const FilterbankConfig& config = FilterbankConfig());

  ~PitchFilterbank();

  // Non-copyable, movable
  PitchFilterbank(const PitchFilterbank&) = delete;
  PitchFilterbank& operator=(const PitchFilterbank&) = delete;
  PitchFilterbank(PitchFilterbank&&) noexcept;
  PitchFilterbank& operator=(PitchFilterbank&&) noexcept;

  /// @brief Processes a chunk of input samples at the nominal rate.
  /// @param samples Input samples
  /// @param size Number of samples
  /// @return Pitch vectors completed by this chunk, in order
  /// @throws ChromaflowException with InvalidState after drain() or after process_multirate()
  std::vector<PitchVector> process(const float* samples, size_t size);

  /// @brief Processes a chunk of input samples at the nominal rate.
  std::vector<PitchVector> process(const std::vector<float>& samples) {
    return process(samples.data(), samples.size());
  }

  /// @brief Processes a chunk resampled by the caller, bypassing the internal resamplers.
  /// @param block Samples for each canonical rate plus their latency
  /// @return Pitch vectors completed by this chunk
  /// @throws ChromaflowException with InvalidState after drain() or after process()
  std::vector<PitchVector> process_multirate(const MultirateBlock& block);

  /// @brief Flushes every pipeline and returns the remaining pitch vectors.
  /// @details Ends the stream. Call reset() before processing a new stream.
  /// @throws ChromaflowException with InvalidState if already drained
  std::vector<PitchVector> drain();

  /// @brief Restores the freshly constructed state.
  void reset();

  /// @brief Returns configuration.
  const FilterbankConfig& config() const { return config_; }

  /// @brief Returns the rate the resamplers treat the input as having.
  int effective_input_rate() const { return effective_input_rate_; }

  /// @brief Returns the nominal to effective input rate ratio.
  double tuning_ratio() const { return tuning_ratio_; }

  /// @brief Returns the output feature rate in Hz.
  float feature_rate() const { return kFilterbankFeatureRate; }

  /// @brief Returns the number of process/drain calls since construction or reset.
  int64_t block_count() const { return block_count_; }

  /// @brief Returns the transient samples still to be dropped for a pitch.
  /// @param pitch MIDI pitch (0-127)
  int pending_latency(int pitch) const;

  /// @brief Returns the output latency reported by the resampler for a canonical rate.
  /// @param rate Canonical sample rate in Hz
  int resampler_latency(int rate) const;

  /// @brief Returns true if pitch is processed by this filterbank.
  bool covers(int pitch) const;

  /// @brief Returns the covered pitches in ascending order.
  const std::vector<int>& pitches() const { return pitches_; }

  /// @brief Returns true once drain() has been called.
  bool drained() const { return drained_; }

 private:
  enum class InputMode { None, Internal, Multirate };

  void begin_stream(InputMode mode, int external_latency);
  void resample_input(const float* samples, size_t size, bool flush);
  std::vector<PitchVector> filter_and_emit(bool drain);

  FilterbankConfig config_;
  int effective_input_rate_;
  double tuning_ratio_;

  // Covered pitches and the rates they need
  std::vector<int> pitches_;
  std::array<bool, kNumSampleRates> rate_in_use_;

  // Per-rate state
  std::vector<StreamResampler> resamplers_;
  std::array<std::vector<float>, kNumSampleRates> resampled_;

  // Per-pitch state, indexed by MIDI pitch
  std::vector<IIRFilter> filters_;
  std::array<int, kNumPitches> group_delays_;
  std::array<int, kNumPitches> to_compensate_;
  std::array<int64_t, kNumPitches> frame_index_;
  std::array<std::vector<float>, kNumPitches> filtered_;
  std::array<std::vector<float>, kNumPitches> energies_;

  // Stream state
  InputMode mode_ = InputMode::None;
  int external_latency_ = 0;
  int64_t block_count_ = 0;
  bool drained_ = false;
};

}  // namespace chromaflow
