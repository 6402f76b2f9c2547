/// @file quantization_test.cpp
/// @brief Tests for step quantization.

#include "feature/quantization.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

TEST_CASE("default quantization settings", "[quantization]") {
  QuantizationSettings settings;
  REQUIRE(settings.steps() == std::vector<float>{0.05f, 0.1f, 0.2f, 0.4f});
  REQUIRE(settings.weights() == std::vector<float>{0.25f, 0.25f, 0.25f, 0.25f});
}

TEST_CASE("quantize_value counts steps reached", "[quantization]") {
  QuantizationSettings settings;

  REQUIRE_THAT(quantize_value(0.0f, settings), WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(quantize_value(0.04f, settings), WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(quantize_value(0.05f, settings), WithinAbs(0.25f, 1e-6f));
  REQUIRE_THAT(quantize_value(0.15f, settings), WithinAbs(0.5f, 1e-6f));
  REQUIRE_THAT(quantize_value(0.3f, settings), WithinAbs(0.75f, 1e-6f));
  REQUIRE_THAT(quantize_value(0.9f, settings), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("quantization is monotonically non-decreasing", "[quantization]") {
  QuantizationSettings settings({0.3f, 0.01f, 0.7f}, {2.0f, 0.5f, 1.0f});

  float previous = quantize_value(-1.0f, settings);
  for (int i = 0; i <= 1000; ++i) {
    float value = quantize_value(static_cast<float>(i) / 1000.0f, settings);
    REQUIRE(value >= previous);
    previous = value;
  }
}

TEST_CASE("steps are sorted with their weights", "[quantization]") {
  QuantizationSettings settings({0.4f, 0.1f, 0.2f}, {4.0f, 1.0f, 2.0f});

  REQUIRE(settings.steps() == std::vector<float>{0.1f, 0.2f, 0.4f});
  REQUIRE(settings.weights() == std::vector<float>{1.0f, 2.0f, 4.0f});
  REQUIRE_THAT(quantize_value(0.25f, settings), WithinAbs(3.0f, 1e-6f));
}

TEST_CASE("mismatched steps and weights are rejected", "[quantization]") {
  try {
    QuantizationSettings settings({0.1f, 0.2f}, {1.0f});
    FAIL("expected exception");
  } catch (const ChromaflowException& e) {
    REQUIRE(e.code() == ErrorCode::ConfigurationMismatch);
  }
}

TEST_CASE("negative weights are rejected", "[quantization]") {
  try {
    QuantizationSettings settings({0.1f}, {-1.0f});
    FAIL("expected exception");
  } catch (const ChromaflowException& e) {
    REQUIRE(e.code() == ErrorCode::InvalidParameter);
  }
}

TEST_CASE("quantize buffer", "[quantization]") {
  auto buffer = FeatureBuffer::from_vector({0.0f, 0.06f, 0.5f, 0.25f}, 2, 10.0f);
  quantize(buffer);

  REQUIRE_THAT(buffer.at(0, 0), WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(buffer.at(0, 1), WithinAbs(0.25f, 1e-6f));
  REQUIRE_THAT(buffer.at(1, 0), WithinAbs(1.0f, 1e-6f));
  REQUIRE_THAT(buffer.at(1, 1), WithinAbs(0.75f, 1e-6f));
}
