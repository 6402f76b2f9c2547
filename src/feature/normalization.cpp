#include "feature/normalization.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"
#include "util/math_utils.h"

namespace chromaflow {

float lp_norm(const float* data, size_t size, NormSpace space) {
  switch (space) {
    case NormSpace::L1:
      return norm_l1(data, size);
    case NormSpace::L2:
      return norm_l2(data, size);
  }
  return 0.0f;
}

void normalize_vector(float* data, size_t size, NormSpace space, float threshold) {
  if (size == 0) {
    return;
  }

  float norm = lp_norm(data, size, space);

  if (norm < threshold) {
    // Near-silent vector: substitute the uniform unit vector
    float unit = space == NormSpace::L1 ? 1.0f / static_cast<float>(size)
                                        : 1.0f / std::sqrt(static_cast<float>(size));
    std::fill(data, data + size, unit);
    return;
  }

  if (norm == 0.0f) {
    return;
  }

  for (size_t i = 0; i < size; ++i) {
    data[i] /= norm;
  }
}

void normalize(FeatureBuffer& buffer, const NormalizationSettings& settings) {
  if (buffer.empty()) {
    return;
  }

  switch (settings.mode) {
    case NormalizationMode::MaxValue: {
      float peak = max_value(buffer.data(), buffer.size());
      if (peak <= 0.0f) {
        return;
      }
      float* data = buffer.data();
      for (size_t i = 0; i < buffer.size(); ++i) {
        data[i] /= peak;
      }
      break;
    }
    case NormalizationMode::LpNorm:
      CHROMAFLOW_CHECK_MSG(settings.threshold >= 0.0f, ErrorCode::InvalidParameter,
                           "Normalization threshold must not be negative");
      for (size_t t = 0; t < buffer.n_frames(); ++t) {
        normalize_vector(buffer.frame(t), buffer.dims(), settings.space, settings.threshold);
      }
      break;
  }
}

}  // namespace chromaflow
