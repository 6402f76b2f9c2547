#include "feature/compression.h"

#include <cmath>

namespace chromaflow {

void compress(float* data, size_t size, const CompressionSettings& settings) {
  for (size_t i = 0; i < size; ++i) {
    data[i] = std::log10(settings.factor * data[i] + settings.term);
  }
}

void compress(FeatureBuffer& buffer, const CompressionSettings& settings) {
  compress(buffer.data(), buffer.size(), settings);
}

}  // namespace chromaflow
