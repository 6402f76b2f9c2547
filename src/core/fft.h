#pragma once

/// @file fft.h
/// @brief Forward real FFT using KissFFT.

#include <complex>
#include <memory>
#include <vector>

namespace chromaflow {

/// @brief Real-valued forward FFT processor using KissFFT.
///
/// Thread Safety:
/// - Different instances can be used concurrently from different threads.
/// - A single instance must NOT be shared between threads without external
///   synchronization, as KissFFT state is modified during computation.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (must be even and positive)
  /// @throws ChromaflowException with OutOfMemory if the KissFFT config cannot be allocated
  explicit FFT(int n_fft);

  ~FFT();

  // Non-copyable, movable
  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Performs forward FFT (real to complex).
  /// @param input Input signal (n_fft samples)
  /// @param output Complex spectrum (n_bins values)
  void forward(const float* input, std::complex<float>* output);

  /// @brief Computes bin magnitudes of a real frame.
  /// @param input Input signal (n_fft samples)
  /// @param output Magnitudes (n_bins values)
  /// @param squared If true, writes |X|^2 instead of |X|
  void magnitude(const float* input, float* output, bool squared = false);

  /// @brief Returns FFT size.
  int n_fft() const { return n_fft_; }

  /// @brief Returns number of frequency bins (n_fft/2 + 1).
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  int n_fft_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace chromaflow
