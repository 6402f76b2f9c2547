/// @file frame_energy.cpp
/// @brief Implementation of frame cutting and energy accumulation.

#include "streaming/frame_energy.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"
#include "util/math_utils.h"

namespace chromaflow {

namespace {
constexpr double kReferenceRate = 22050.0;
constexpr double kReferenceFrameSize = 4410.0;
constexpr double kReferenceHop = 2205.0;
}  // namespace

FrameGeometry FrameGeometry::at(int64_t frame, int rate, double tuning_ratio, bool drain) {
  FrameGeometry geometry;
  geometry.factor = kReferenceRate / static_cast<double>(rate);

  double size_ratio = tuning_ratio / geometry.factor;
  geometry.size = round_to_int(kReferenceFrameSize * size_ratio);

  auto start = [size_ratio](int64_t index) {
    return static_cast<int64_t>(std::round(kReferenceHop * static_cast<double>(index) * size_ratio));
  };
  geometry.hop = static_cast<int>(start(frame + 1) - start(frame));
  geometry.minimum = drain ? geometry.hop : geometry.size;
  return geometry;
}

size_t cut_frames(std::vector<float>& samples, int64_t& frame_index, int rate,
                  double tuning_ratio, bool drain, std::vector<float>& energies) {
  size_t offset = 0;
  size_t n_cut = 0;

  while (true) {
    FrameGeometry geometry = FrameGeometry::at(frame_index, rate, tuning_ratio, drain);
    CHROMAFLOW_CHECK_MSG(geometry.hop > 0 && geometry.size > 0, ErrorCode::InvalidState,
                         "Degenerate frame geometry");

    size_t remaining = samples.size() - offset;
    if (remaining < static_cast<size_t>(geometry.minimum)) {
      break;
    }

    size_t count = std::min(static_cast<size_t>(geometry.size), remaining);
    double energy = 0.0;
    for (size_t i = 0; i < count; ++i) {
      double x = samples[offset + i];
      energy += x * x;
    }
    energies.push_back(static_cast<float>(energy * geometry.factor));

    offset += std::min(static_cast<size_t>(geometry.hop), remaining);
    ++frame_index;
    ++n_cut;
  }

  samples.erase(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(offset));
  return n_cut;
}

}  // namespace chromaflow
