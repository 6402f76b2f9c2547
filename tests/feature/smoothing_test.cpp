/// @file smoothing_test.cpp
/// @brief Tests for temporal smoothing and downsampling.

#include "feature/smoothing.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <utility>
#include <vector>

#include "feature/normalization.h"
#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

namespace {
FeatureBuffer ramp_buffer(size_t n_frames, size_t dims, float rate) {
  std::vector<float> data(n_frames * dims);
  for (size_t t = 0; t < n_frames; ++t) {
    for (size_t d = 0; d < dims; ++d) {
      data[t * dims + d] = static_cast<float>(d + 1) + 0.1f * static_cast<float>(t);
    }
  }
  return FeatureBuffer::from_vector(std::move(data), dims, rate);
}
}  // namespace

TEST_CASE("smoothing output count and rate", "[smoothing]") {
  for (size_t n_frames : {1u, 4u, 5u, 6u, 23u, 100u}) {
    for (int factor : {1, 2, 5, 10}) {
      SmoothingSettings settings;
      settings.window_size = 21;
      settings.downsample_factor = factor;

      FeatureBuffer out = smooth(ramp_buffer(n_frames, 12, 10.0f), settings);
      INFO("frames " << n_frames << " factor " << factor);
      REQUIRE(out.n_frames() == (n_frames + factor - 1) / factor);
      REQUIRE(out.dims() == 12);
      REQUIRE_THAT(out.feature_rate(), WithinAbs(10.0f / factor, 1e-6f));
    }
  }
}

TEST_CASE("smoothed frames are l2 normalized", "[smoothing]") {
  FeatureBuffer out = smooth(ramp_buffer(50, 12, 10.0f));

  REQUIRE(out.n_frames() == 10);
  for (size_t t = 0; t < out.n_frames(); ++t) {
    REQUIRE_THAT(lp_norm(out.frame(t), 12, NormSpace::L2), WithinAbs(1.0f, 1e-5f));
  }
}

TEST_CASE("window of one keeps frame shape", "[smoothing]") {
  SmoothingSettings settings;
  settings.window_size = 1;
  settings.downsample_factor = 1;

  auto buffer = FeatureBuffer::from_vector({3.0f, 4.0f, 0.0f, 2.0f}, 2, 10.0f);
  FeatureBuffer out = smooth(buffer, settings);

  REQUIRE(out.n_frames() == 2);
  REQUIRE_THAT(out.at(0, 0), WithinAbs(0.6f, 1e-6f));
  REQUIRE_THAT(out.at(0, 1), WithinAbs(0.8f, 1e-6f));
  REQUIRE_THAT(out.at(1, 0), WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(out.at(1, 1), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("smoothing a constant buffer stays constant", "[smoothing]") {
  auto buffer = FeatureBuffer::from_vector(std::vector<float>(40 * 2, 1.0f), 2, 10.0f);
  FeatureBuffer out = smooth(buffer);

  float unit = 1.0f / std::sqrt(2.0f);
  for (size_t t = 0; t < out.n_frames(); ++t) {
    REQUIRE_THAT(out.at(t, 0), WithinAbs(unit, 1e-5f));
    REQUIRE_THAT(out.at(t, 1), WithinAbs(unit, 1e-5f));
  }
}

TEST_CASE("smoothing empty buffer", "[smoothing]") {
  FeatureBuffer out = smooth(FeatureBuffer(12, 10.0f));
  REQUIRE(out.empty());
  REQUIRE_THAT(out.feature_rate(), WithinAbs(2.0f, 1e-6f));
}

TEST_CASE("smoothing rejects non-positive settings", "[smoothing]") {
  FeatureBuffer buffer = ramp_buffer(10, 12, 10.0f);

  SmoothingSettings bad_window;
  bad_window.window_size = 0;
  REQUIRE_THROWS_AS(smooth(buffer, bad_window), ChromaflowException);

  SmoothingSettings bad_factor;
  bad_factor.downsample_factor = 0;
  REQUIRE_THROWS_AS(smooth(buffer, bad_factor), ChromaflowException);
}
