/// @file dct_test.cpp
/// @brief Tests for DCT matrices and pitch liftering.

#include "filters/dct.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

TEST_CASE("dct matrix is orthonormal", "[dct]") {
  constexpr int n = 16;
  auto dct = create_dct_matrix(n, n);
  REQUIRE(dct.size() == static_cast<size_t>(n * n));

  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      float dot = 0.0f;
      for (int k = 0; k < n; ++k) {
        dot += dct[i * n + k] * dct[j * n + k];
      }
      REQUIRE_THAT(dot, WithinAbs(i == j ? 1.0f : 0.0f, 1e-5f));
    }
  }
}

TEST_CASE("full lifter is identity", "[dct]") {
  constexpr int n = 128;
  auto lifter = create_dct_lifter(n, 0, n);

  for (int i = 0; i < n; i += 7) {
    for (int j = 0; j < n; j += 5) {
      REQUIRE_THAT(lifter[i * n + j], WithinAbs(i == j ? 1.0f : 0.0f, 1e-4f));
    }
  }
}

TEST_CASE("empty lifter removes everything", "[dct]") {
  constexpr int n = 32;
  auto lifter = create_dct_lifter(n, 10, 10);

  std::vector<float> frame(n, 1.0f);
  auto out = apply_dct_lifter(frame.data(), 1, n, lifter);
  for (float v : out) {
    REQUIRE_THAT(v, WithinAbs(0.0f, 1e-6f));
  }
}

TEST_CASE("lifter dropping the first coefficient removes the mean", "[dct]") {
  constexpr int n = 128;
  auto lifter = create_dct_lifter(n, 1, n);

  // Two frames: constant and constant plus an impulse
  std::vector<float> frames(2 * n, 3.0f);
  frames[n + 40] += 1.0f;
  auto out = apply_dct_lifter(frames.data(), 2, n, lifter);
  REQUIRE(out.size() == frames.size());

  float sum0 = 0.0f;
  float sum1 = 0.0f;
  for (int i = 0; i < n; ++i) {
    REQUIRE_THAT(out[i], WithinAbs(0.0f, 1e-4f));
    sum0 += out[i];
    sum1 += out[n + i];
  }
  REQUIRE_THAT(sum0, WithinAbs(0.0f, 1e-3f));
  REQUIRE_THAT(sum1, WithinAbs(0.0f, 1e-3f));
  REQUIRE_THAT(out[n + 40], WithinAbs(1.0f - 1.0f / n, 1e-4f));
}

TEST_CASE("lifter validation", "[dct]") {
  REQUIRE_THROWS_AS(create_dct_lifter(0, 0, 0), ChromaflowException);
  REQUIRE_THROWS_AS(create_dct_lifter(128, 55, 129), ChromaflowException);
  REQUIRE_THROWS_AS(create_dct_lifter(128, 60, 55), ChromaflowException);

  auto lifter = create_dct_lifter(8, 0, 8);
  std::vector<float> frame(12, 0.0f);
  REQUIRE_THROWS_AS(apply_dct_lifter(frame.data(), 1, 12, lifter), ChromaflowException);
  REQUIRE(apply_dct_lifter(nullptr, 0, 8, lifter).empty());
}
