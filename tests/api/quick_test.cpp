/// @file quick_test.cpp
/// @brief Tests for quick API functions.

#include "quick.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <string>
#include <vector>

#include "chromaflow.h"
#include "util/test_helpers.h"

using Catch::Matchers::WithinAbs;

namespace {

// Generate sine wave
std::vector<float> generate_sine(float freq, int sample_rate, float duration) {
  size_t n_samples = static_cast<size_t>(sample_rate * duration);
  std::vector<float> samples(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    samples[i] = std::sin(2.0f * static_cast<float>(M_PI) * freq * i / sample_rate);
  }
  return samples;
}

}  // namespace

TEST_CASE("quick::pitch_features", "[quick]") {
  auto samples = generate_sine(440.0f, 22050, 1.0f);
  chromaflow::FeatureBuffer pitch =
      chromaflow::quick::pitch_features(samples.data(), samples.size(), 22050);

  REQUIRE(pitch.dims() == 128);
  REQUIRE_THAT(pitch.feature_rate(), WithinAbs(10.0f, 1e-6f));
  REQUIRE(chromaflow::test::argmax(pitch.frame(pitch.n_frames() / 2), 128) == 69);
}

TEST_CASE("quick::chroma_features", "[quick]") {
  auto samples = generate_sine(261.63f, 44100, 2.0f);

  SECTION("CP") {
    chromaflow::FeatureBuffer chroma =
        chromaflow::quick::chroma_features(samples.data(), samples.size(), 44100);
    REQUIRE(chroma.dims() == 12);
    REQUIRE(chromaflow::test::argmax(chroma.frame(chroma.n_frames() / 2), 12) == 0);
  }

  SECTION("CENS") {
    chromaflow::FeatureBuffer chroma = chromaflow::quick::chroma_features(
        samples.data(), samples.size(), 44100, chromaflow::ChromaVariant::cens());
    REQUIRE(chroma.dims() == 12);
    REQUIRE_THAT(chroma.feature_rate(), WithinAbs(2.0f, 1e-6f));
    REQUIRE(chromaflow::test::argmax(chroma.frame(chroma.n_frames() / 2), 12) == 0);
  }
}

TEST_CASE("version", "[version]") {
  REQUIRE(std::string(chromaflow::version()) == CHROMAFLOW_VERSION_STRING);
  REQUIRE(chromaflow::version_major() == CHROMAFLOW_VERSION_MAJOR);
  REQUIRE(chromaflow::version_minor() == CHROMAFLOW_VERSION_MINOR);
  REQUIRE(chromaflow::version_patch() == CHROMAFLOW_VERSION_PATCH);
}
