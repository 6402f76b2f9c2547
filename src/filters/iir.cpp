#include "filters/iir.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "util/exception.h"

namespace chromaflow {

namespace {

/// @brief Flushes subnormal values to zero.
inline double flush_denormal(double value) {
  return std::fpclassify(value) == FP_SUBNORMAL ? 0.0 : value;
}

}  // namespace

IIRFilter::IIRFilter(std::vector<double> b, std::vector<double> a)
    : b_(std::move(b)), a_(std::move(a)) {
  if (b_.empty() || a_.empty()) {
    b_.clear();
    a_.clear();
    return;
  }
  CHROMAFLOW_CHECK_MSG(a_[0] != 0.0, ErrorCode::InvalidParameter,
                       "First feedback coefficient must not be zero");

  double a0 = a_[0];
  for (double& c : a_) c /= a0;
  for (double& c : b_) c /= a0;

  // Equal lengths keep the recurrence uniform
  size_t taps = std::max(a_.size(), b_.size());
  a_.resize(taps, 0.0);
  b_.resize(taps, 0.0);
  state_.assign(taps, 0.0);
}

void IIRFilter::process(const float* input, size_t size, float* output) {
  if (size == 0) {
    return;
  }
  CHROMAFLOW_CHECK(input != nullptr && output != nullptr, ErrorCode::InvalidParameter);

  if (is_identity()) {
    std::copy(input, input + size, output);
    return;
  }

  const size_t taps = state_.size();
  for (size_t n = 0; n < size; ++n) {
    double x = input[n];
    double y = b_[0] * x + state_[0];
    for (size_t k = 1; k < taps; ++k) {
      double next = k + 1 < taps ? state_[k] : 0.0;
      state_[k - 1] = flush_denormal(b_[k] * x - a_[k] * y + next);
    }
    output[n] = static_cast<float>(y);
  }
}

std::vector<float> IIRFilter::process(const float* input, size_t size) {
  std::vector<float> output(size);
  process(input, size, output.data());
  return output;
}

void IIRFilter::reset() { std::fill(state_.begin(), state_.end(), 0.0); }

}  // namespace chromaflow
