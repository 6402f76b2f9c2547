/// @file decibel_test.cpp
/// @brief Tests for decibel conversion.

#include "feature/decibel.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

TEST_CASE("power decibels", "[decibel]") {
  std::vector<float> data = {1.0f, 10.0f, 0.01f};
  to_decibels(data.data(), data.size());

  REQUIRE_THAT(data[0], WithinAbs(0.0f, 1e-5f));
  REQUIRE_THAT(data[1], WithinAbs(10.0f, 1e-5f));
  REQUIRE_THAT(data[2], WithinAbs(-20.0f, 1e-4f));
}

TEST_CASE("amplitude decibels with reference", "[decibel]") {
  DecibelSettings settings;
  settings.scale = DecibelScale::Amplitude;
  settings.zero_reference = 0.5f;
  REQUIRE(settings.multiplier() == 20.0f);

  std::vector<float> data = {0.5f, 5.0f};
  to_decibels(data.data(), data.size(), settings);

  REQUIRE_THAT(data[0], WithinAbs(0.0f, 1e-5f));
  REQUIRE_THAT(data[1], WithinAbs(20.0f, 1e-4f));
}

TEST_CASE("silence maps to the floor", "[decibel]") {
  auto buffer = FeatureBuffer::from_vector({0.0f, -1.0f}, 2, 10.0f);
  to_decibels(buffer);

  REQUIRE_THAT(buffer.at(0, 0), WithinAbs(-100.0f, 1e-3f));
  REQUIRE_THAT(buffer.at(0, 1), WithinAbs(-100.0f, 1e-3f));
}

TEST_CASE("non-positive reference is rejected", "[decibel]") {
  DecibelSettings settings;
  settings.zero_reference = 0.0f;

  std::vector<float> data = {1.0f};
  REQUIRE_THROWS_AS(to_decibels(data.data(), data.size(), settings), ChromaflowException);
}
