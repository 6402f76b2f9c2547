/// @file fft.cpp
/// @brief Implementation of FFT wrapper.

#include "core/fft.h"

#include <cmath>

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace chromaflow {

struct FFT::Impl {
  kiss_fftr_cfg forward_cfg;
  std::vector<std::complex<float>> spectrum;

  explicit Impl(int n_fft) : spectrum(static_cast<size_t>(n_fft / 2 + 1)) {
    forward_cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    if (!forward_cfg) {
      throw ChromaflowException(ErrorCode::OutOfMemory, "Failed to allocate KissFFT config");
    }
  }

  ~Impl() {
    if (forward_cfg) kiss_fft_free(forward_cfg);
  }
};

FFT::FFT(int n_fft) : n_fft_(n_fft) {
  CHROMAFLOW_CHECK_MSG(n_fft > 0 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                       "FFT size must be even and positive");
  impl_ = std::make_unique<Impl>(n_fft);
}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->forward_cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

void FFT::magnitude(const float* input, float* output, bool squared) {
  forward(input, impl_->spectrum.data());
  int bins = n_bins();
  for (int k = 0; k < bins; ++k) {
    float power = std::norm(impl_->spectrum[k]);
    output[k] = squared ? power : std::sqrt(power);
  }
}

}  // namespace chromaflow
