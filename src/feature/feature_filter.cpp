#include "feature/feature_filter.h"

#include <sstream>
#include <utility>

namespace chromaflow {

namespace {

const char* norm_space_name(NormSpace space) {
  switch (space) {
    case NormSpace::L1:
      return "l1";
    case NormSpace::L2:
      return "l2";
  }
  return "?";
}

template <typename T>
std::string join(const std::vector<T>& values) {
  std::ostringstream oss;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << values[i];
  }
  return oss.str();
}

}  // namespace

FeatureFilter FeatureFilter::make(const CompressionSettings& settings) {
  FeatureFilter filter;
  filter.type = FeatureFilterType::Compression;
  filter.compression = settings;
  return filter;
}

FeatureFilter FeatureFilter::make(const NormalizationSettings& settings) {
  FeatureFilter filter;
  filter.type = FeatureFilterType::Normalization;
  filter.normalization = settings;
  return filter;
}

FeatureFilter FeatureFilter::make(const QuantizationSettings& settings) {
  FeatureFilter filter;
  filter.type = FeatureFilterType::Quantization;
  filter.quantization = settings;
  return filter;
}

FeatureFilter FeatureFilter::make(const SmoothingSettings& settings) {
  FeatureFilter filter;
  filter.type = FeatureFilterType::Smoothing;
  filter.smoothing = settings;
  return filter;
}

FeatureFilter FeatureFilter::make(const DecibelSettings& settings) {
  FeatureFilter filter;
  filter.type = FeatureFilterType::Decibel;
  filter.decibel = settings;
  return filter;
}

FeatureBuffer apply_filter(FeatureBuffer buffer, const FeatureFilter& filter) {
  switch (filter.type) {
    case FeatureFilterType::Compression:
      compress(buffer, filter.compression);
      return buffer;
    case FeatureFilterType::Normalization:
      normalize(buffer, filter.normalization);
      return buffer;
    case FeatureFilterType::Quantization:
      quantize(buffer, filter.quantization);
      return buffer;
    case FeatureFilterType::Smoothing:
      return smooth(buffer, filter.smoothing);
    case FeatureFilterType::Decibel:
      to_decibels(buffer, filter.decibel);
      return buffer;
  }
  return buffer;
}

FeatureBuffer apply_chain(FeatureBuffer buffer, const std::vector<FeatureFilter>& filters) {
  for (const auto& filter : filters) {
    buffer = apply_filter(std::move(buffer), filter);
  }
  return buffer;
}

std::string describe(const FeatureFilter& filter) {
  std::ostringstream oss;
  switch (filter.type) {
    case FeatureFilterType::Compression:
      oss << "Compression (term: " << filter.compression.term
          << ", factor: " << filter.compression.factor << ")";
      break;
    case FeatureFilterType::Normalization:
      if (filter.normalization.mode == NormalizationMode::MaxValue) {
        oss << "Normalization (max value)";
      } else {
        oss << "Normalization (" << norm_space_name(filter.normalization.space)
            << " norm, threshold: " << filter.normalization.threshold << ")";
      }
      break;
    case FeatureFilterType::Quantization:
      oss << "Quantization (steps: [" << join(filter.quantization.steps()) << "], weights: ["
          << join(filter.quantization.weights()) << "])";
      break;
    case FeatureFilterType::Smoothing:
      oss << "Smoothing (window size: " << filter.smoothing.window_size
          << ", downsample factor: " << filter.smoothing.downsample_factor << ")";
      break;
    case FeatureFilterType::Decibel:
      oss << "Decibel conversion (multiplier: " << filter.decibel.multiplier()
          << ", zero reference: " << filter.decibel.zero_reference << ")";
      break;
  }
  return oss.str();
}

}  // namespace chromaflow
