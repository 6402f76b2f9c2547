#include "feature/quantization.h"

#include <algorithm>
#include <numeric>
#include <utility>

#include "util/exception.h"

namespace chromaflow {

QuantizationSettings::QuantizationSettings()
    : steps_{0.05f, 0.1f, 0.2f, 0.4f}, weights_{0.25f, 0.25f, 0.25f, 0.25f} {}

QuantizationSettings::QuantizationSettings(std::vector<float> steps, std::vector<float> weights) {
  CHROMAFLOW_CHECK_MSG(steps.size() == weights.size(), ErrorCode::ConfigurationMismatch,
                       "Quantization steps and weights must have the same length");
  for (float w : weights) {
    CHROMAFLOW_CHECK_MSG(w >= 0.0f, ErrorCode::InvalidParameter,
                         "Quantization weights must not be negative");
  }

  std::vector<size_t> order(steps.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&steps](size_t a, size_t b) { return steps[a] < steps[b]; });

  steps_.reserve(order.size());
  weights_.reserve(order.size());
  for (size_t i : order) {
    steps_.push_back(steps[i]);
    weights_.push_back(weights[i]);
  }
}

float quantize_value(float value, const QuantizationSettings& settings) {
  const auto& steps = settings.steps();
  const auto& weights = settings.weights();

  float result = 0.0f;
  for (size_t i = 0; i < steps.size(); ++i) {
    if (value < steps[i]) break;
    result += weights[i];
  }
  return result;
}

void quantize(float* data, size_t size, const QuantizationSettings& settings) {
  for (size_t i = 0; i < size; ++i) {
    data[i] = quantize_value(data[i], settings);
  }
}

void quantize(FeatureBuffer& buffer, const QuantizationSettings& settings) {
  quantize(buffer.data(), buffer.size(), settings);
}

}  // namespace chromaflow
