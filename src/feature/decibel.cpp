#include "feature/decibel.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace chromaflow {

void to_decibels(float* data, size_t size, const DecibelSettings& settings) {
  CHROMAFLOW_CHECK_MSG(settings.zero_reference > 0.0f, ErrorCode::InvalidParameter,
                       "Decibel zero reference must be positive");

  float multiplier = settings.multiplier();
  for (size_t i = 0; i < size; ++i) {
    float ratio = std::max(data[i] / settings.zero_reference, kDecibelFloor);
    data[i] = multiplier * std::log10(ratio);
  }
}

void to_decibels(FeatureBuffer& buffer, const DecibelSettings& settings) {
  to_decibels(buffer.data(), buffer.size(), settings);
}

}  // namespace chromaflow
