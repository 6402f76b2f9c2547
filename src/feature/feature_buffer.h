#pragma once

/// @file feature_buffer.h
/// @brief Sequences of fixed-size feature vectors at a fixed feature rate.

#include <array>
#include <cstddef>
#include <vector>

#include "core/sample_rate.h"
#include "util/types.h"

namespace chromaflow {

/// @brief Energies for the 128 MIDI pitches.
using PitchVector = std::array<float, kNumPitches>;

/// @brief Energies for the 12 pitch classes (index = pitch % 12).
using ChromaVector = std::array<float, kNumChroma>;

/// @brief FFT bin magnitudes (n_fft/2 + 1 values).
using BinVector = std::vector<float>;

/// @brief Ordered frames of equal-length vectors plus a feature rate.
/// @details Frames are stored contiguously in row-major order [n_frames x dims].
class FeatureBuffer {
 public:
  /// @brief Creates an empty buffer.
  FeatureBuffer();

  /// @brief Creates an empty buffer for vectors of a given length.
  /// @param dims Values per frame (> 0)
  /// @param feature_rate Frames per second (> 0)
  FeatureBuffer(size_t dims, float feature_rate);

  /// @brief Creates a buffer from row-major data.
  /// @param data Frame data [n_frames x dims] (moved)
  /// @param dims Values per frame
  /// @param feature_rate Frames per second
  /// @throws ChromaflowException with ConfigurationMismatch if data.size() % dims != 0
  static FeatureBuffer from_vector(std::vector<float> data, size_t dims, float feature_rate);

  /// @brief Returns values per frame.
  size_t dims() const { return dims_; }

  /// @brief Returns number of frames.
  size_t n_frames() const { return dims_ == 0 ? 0 : data_.size() / dims_; }

  /// @brief Returns frames per second.
  float feature_rate() const { return feature_rate_; }

  /// @brief Sets frames per second.
  void set_feature_rate(float feature_rate);

  /// @brief Returns true if the buffer holds no frames.
  bool empty() const { return data_.empty(); }

  /// @brief Returns pointer to the start of frame i.
  const float* frame(size_t i) const { return data_.data() + i * dims_; }

  /// @brief Returns mutable pointer to the start of frame i.
  float* frame(size_t i) { return data_.data() + i * dims_; }

  /// @brief Bounds-checked element access.
  /// @throws ChromaflowException with InvalidParameter if out of range
  float at(size_t frame, size_t dim) const;

  /// @brief Bounds-checked mutable element access.
  float& at(size_t frame, size_t dim);

  /// @brief Returns the contiguous row-major data.
  const float* data() const { return data_.data(); }
  float* data() { return data_.data(); }

  /// @brief Returns total element count (n_frames * dims).
  size_t size() const { return data_.size(); }

  /// @brief Appends one frame.
  /// @param values Frame values (dims() entries)
  void append(const float* values);

  /// @brief Appends one fixed-size vector.
  /// @throws ChromaflowException with ConfigurationMismatch if N != dims()
  template <size_t N>
  void append(const std::array<float, N>& vector) {
    check_dims(N);
    append(vector.data());
  }

  /// @brief Appends every frame of another buffer with the same shape.
  void append(const FeatureBuffer& other);

  /// @brief Returns frame i as a fixed-size vector.
  template <size_t N>
  std::array<float, N> vector_at(size_t i) const {
    check_dims(N);
    std::array<float, N> out{};
    const float* src = frame(checked_frame(i));
    for (size_t d = 0; d < N; ++d) out[d] = src[d];
    return out;
  }

  /// @brief Returns a read-only matrix view [n_frames x dims].
  MatrixView<float> to_matrix() const { return MatrixView<float>(data_.data(), n_frames(), dims_); }

  /// @brief Returns the duration covered by the frames in seconds.
  float duration() const;

 private:
  void check_dims(size_t n) const;
  size_t checked_frame(size_t i) const;

  size_t dims_;
  float feature_rate_;
  std::vector<float> data_;
};

/// @brief Creates an empty buffer of 128-pitch vectors.
inline FeatureBuffer make_pitch_buffer(float feature_rate) {
  return FeatureBuffer(kNumPitches, feature_rate);
}

/// @brief Creates an empty buffer of 12-chroma vectors.
inline FeatureBuffer make_chroma_buffer(float feature_rate) {
  return FeatureBuffer(kNumChroma, feature_rate);
}

}  // namespace chromaflow
