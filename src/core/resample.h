#pragma once

/// @file resample.h
/// @brief High-quality audio resampling using r8brain.

#include <memory>
#include <vector>

namespace r8b {
class CDSPResampler24;
}  // namespace r8b

namespace chromaflow {

/// @brief Streaming resampler with persistent state across calls.
/// @details Wraps one r8brain converter. When source and target rates match the
///          resampler is a pass-through with zero latency.
class StreamResampler {
 public:
  /// @brief Constructs a resampler.
  /// @param src_sr Source sample rate in Hz
  /// @param target_sr Target sample rate in Hz
  /// @param block_size Largest block handed to r8brain per call
  StreamResampler(int src_sr, int target_sr, int block_size = 1024);
  ~StreamResampler();

  StreamResampler(StreamResampler&&) noexcept;
  StreamResampler& operator=(StreamResampler&&) noexcept;
  StreamResampler(const StreamResampler&) = delete;
  StreamResampler& operator=(const StreamResampler&) = delete;

  /// @brief Resamples a chunk and appends the produced samples to out.
  /// @param samples Input samples at the source rate
  /// @param size Number of input samples
  /// @param out Destination for samples at the target rate
  void process(const float* samples, size_t size, std::vector<float>& out);

  /// @brief Resamples a chunk.
  /// @return Samples at the target rate produced by this chunk
  std::vector<float> process(const float* samples, size_t size);

  /// @brief Feeds flush_length() zeros and appends the produced samples to out.
  void flush(std::vector<float>& out);

  /// @brief Restores the freshly constructed state.
  void reset();

  /// @brief Number of zero input samples needed to push all buffered content out.
  int flush_length() const;

  /// @brief Transient output samples the caller must discard (0 when self-compensated).
  int output_latency() const;

  /// @brief Returns true if source and target rates are equal.
  bool passthrough() const { return resampler_ == nullptr; }

  int source_rate() const { return src_sr_; }
  int target_rate() const { return target_sr_; }

 private:
  int src_sr_;
  int target_sr_;
  int block_size_;
  std::unique_ptr<r8b::CDSPResampler24> resampler_;
  std::vector<double> in_block_;
};

/// @brief Resamples raw samples to a target sample rate.
/// @param samples Input samples
/// @param size Number of input samples
/// @param src_sr Source sample rate in Hz
/// @param target_sr Target sample rate in Hz
/// @return Resampled samples, round(size * target_sr / src_sr) long
std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr);

}  // namespace chromaflow
