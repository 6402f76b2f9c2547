#pragma once

/// @file iir.h
/// @brief Streaming IIR filter of arbitrary order.

#include <cstddef>
#include <vector>

namespace chromaflow {

/// @brief Direct Form II Transposed IIR filter with persistent state.
/// @details Implements a0*y[n] = sum(b[k]*x[n-k]) - sum(a[k]*y[n-k], k >= 1).
///          Coefficients are normalized by a[0] on construction. The delay line
///          carries over between process() calls, so a signal split into chunks
///          filters identically to the whole signal. A filter built from empty
///          coefficient vectors passes samples through unchanged.
class IIRFilter {
 public:
  /// @brief Constructs an identity filter.
  IIRFilter() = default;

  /// @brief Constructs a filter from coefficient vectors.
  /// @param b Feed-forward coefficients
  /// @param a Feedback coefficients (a[0] must be non-zero)
  /// @throws ChromaflowException with InvalidParameter if a[0] == 0
  IIRFilter(std::vector<double> b, std::vector<double> a);

  /// @brief Filters a chunk of samples.
  /// @param input Input samples
  /// @param size Number of samples
  /// @param output Output buffer (size samples, may alias input)
  void process(const float* input, size_t size, float* output);

  /// @brief Filters a chunk of samples.
  /// @return Filtered samples
  std::vector<float> process(const float* input, size_t size);

  /// @brief Clears the delay line.
  void reset();

  /// @brief Returns true if the filter passes input through unchanged.
  bool is_identity() const { return b_.empty(); }

  /// @brief Returns the filter order.
  size_t order() const { return state_.empty() ? 0 : state_.size() - 1; }

 private:
  std::vector<double> b_;
  std::vector<double> a_;
  std::vector<double> state_;
};

}  // namespace chromaflow
