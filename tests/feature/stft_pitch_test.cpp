/// @file stft_pitch_test.cpp
/// @brief Tests for STFT based pitch extraction.

#include "feature/stft_pitch.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"
#include "util/test_helpers.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

std::vector<float> generate_sine(int samples, float freq, int sr) {
  std::vector<float> result(samples);
  for (int i = 0; i < samples; ++i) {
    result[i] = std::sin(kTwoPi * freq * i / sr);
  }
  return result;
}
}  // namespace

TEST_CASE("StftPitchConfig defaults", "[stft_pitch]") {
  StftPitchConfig config;
  REQUIRE(config.n_bins() == 2206);
  REQUIRE_THAT(config.feature_rate(), WithinAbs(10.0f, 1e-6f));
  REQUIRE(config.n_frames(22050) == 10);
  REQUIRE(config.n_frames(22051) == 11);
  REQUIRE(config.n_frames(0) == 0);
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("StftPitchConfig validation", "[stft_pitch]") {
  StftPitchConfig odd;
  odd.window_size = 4411;
  REQUIRE_THROWS_AS(odd.validate(), ChromaflowException);

  StftPitchConfig no_hop;
  no_hop.hop_size = 0;
  REQUIRE_THROWS_AS(no_hop.validate(), ChromaflowException);

  StftPitchConfig no_tuning;
  no_tuning.tuning_hz = 0.0f;
  REQUIRE_THROWS_AS(no_tuning.validate(), ChromaflowException);
}

TEST_CASE("bin vectors of a bin-centred sine", "[stft_pitch]") {
  StftPitchConfig config;
  auto samples = generate_sine(config.sample_rate, 440.0f, config.sample_rate);

  auto frames = compute_bin_vectors(samples.data(), samples.size(), config);
  REQUIRE(frames.size() == 10);
  REQUIRE(frames[0].size() == 2206);

  // A unit sine reads as magnitude 1 with the window scaled to sum 2
  const BinVector& middle = frames[4];
  REQUIRE(test::argmax(middle.data(), middle.size()) == 88);
  REQUIRE_THAT(middle[88], WithinAbs(1.0f, 0.01f));

  StftPitchConfig power_config = config;
  power_config.representation = BinRepresentation::Power;
  auto power = compute_bin_vectors(samples.data(), samples.size(), power_config);
  REQUIRE_THAT(power[4][88], WithinAbs(middle[88] * middle[88], 1e-4f));
}

TEST_CASE("frames past the end are zero filled", "[stft_pitch]") {
  StftPitchConfig config;
  auto samples = generate_sine(config.sample_rate, 440.0f, config.sample_rate);
  auto frames = compute_bin_vectors(samples.data(), samples.size(), config);

  // The last frame holds half a window of signal
  REQUIRE(frames.back()[88] > 0.1f);
  REQUIRE(frames.back()[88] < 0.9f);
}

TEST_CASE("zero phase does not change magnitudes", "[stft_pitch]") {
  StftPitchConfig config;
  config.window_size = 1024;
  config.hop_size = 512;
  auto samples = generate_sine(8192, 1000.0f, config.sample_rate);

  StftPitchConfig plain = config;
  plain.zero_phase = false;

  auto a = compute_bin_vectors(samples.data(), samples.size(), config);
  auto b = compute_bin_vectors(samples.data(), samples.size(), plain);
  REQUIRE(a.size() == b.size());
  for (size_t t = 0; t < a.size(); ++t) {
    for (size_t k = 0; k < a[t].size(); k += 11) {
      REQUIRE_THAT(a[t][k], WithinAbs(b[t][k], 1e-4f));
    }
  }
}

TEST_CASE("serial and parallel agree", "[stft_pitch]") {
  StftPitchConfig config;
  config.window_size = 512;
  config.hop_size = 64;
  auto samples = generate_sine(22050, 440.0f, config.sample_rate);

  StftPitchConfig serial = config;
  serial.parallel = false;

  auto a = compute_bin_vectors(samples.data(), samples.size(), config);
  auto b = compute_bin_vectors(samples.data(), samples.size(), serial);
  REQUIRE(a == b);
}

TEST_CASE("progress is reported per batch", "[stft_pitch]") {
  StftPitchConfig config;
  config.window_size = 512;
  config.hop_size = 256;
  auto samples = generate_sine(256 * 200, 440.0f, config.sample_rate);

  std::vector<float> reports;
  compute_bin_vectors(samples.data(), samples.size(), config,
                      [&reports](float p) { reports.push_back(p); });

  // 200 frames in batches of 64
  REQUIRE(reports.size() == 4);
  for (size_t i = 1; i < reports.size(); ++i) {
    REQUIRE(reports[i] > reports[i - 1]);
  }
  REQUIRE_THAT(reports.back(), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("extract_stft_pitch finds A4", "[stft_pitch]") {
  StftPitchConfig config;
  auto samples = generate_sine(config.sample_rate, 440.0f, config.sample_rate);

  FeatureBuffer pitch = extract_stft_pitch(samples.data(), samples.size(), config);
  REQUIRE(pitch.dims() == 128);
  REQUIRE(pitch.n_frames() == 10);
  REQUIRE_THAT(pitch.feature_rate(), WithinAbs(10.0f, 1e-6f));

  for (size_t t = 1; t + 1 < pitch.n_frames(); ++t) {
    REQUIRE(test::argmax(pitch.frame(t), 128) == 69);
  }
}

TEST_CASE("extract_stft_pitch of empty input", "[stft_pitch]") {
  FeatureBuffer pitch = extract_stft_pitch(nullptr, 0);
  REQUIRE(pitch.empty());
  REQUIRE(pitch.dims() == 128);
}
