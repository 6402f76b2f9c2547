/// @file fft_test.cpp
/// @brief Tests for FFT wrapper.

#include "core/fft.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <complex>
#include <vector>

#include "util/exception.h"
#include "util/test_helpers.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;
}  // namespace

TEST_CASE("FFT sizes", "[fft]") {
  FFT fft(4410);
  REQUIRE(fft.n_fft() == 4410);
  REQUIRE(fft.n_bins() == 2206);
}

TEST_CASE("FFT rejects invalid sizes", "[fft]") {
  REQUIRE_THROWS_AS(FFT(0), ChromaflowException);
  REQUIRE_THROWS_AS(FFT(-4), ChromaflowException);
  REQUIRE_THROWS_AS(FFT(1023), ChromaflowException);
}

TEST_CASE("FFT of impulse is flat", "[fft]") {
  constexpr int n = 64;
  FFT fft(n);
  std::vector<float> input(n, 0.0f);
  input[0] = 1.0f;

  std::vector<std::complex<float>> output(fft.n_bins());
  fft.forward(input.data(), output.data());

  for (const auto& c : output) {
    REQUIRE_THAT(std::abs(c), WithinAbs(1.0f, 1e-5f));
  }
}

TEST_CASE("FFT magnitude peaks at sine bin", "[fft]") {
  constexpr int n = 1024;
  constexpr int bin = 37;
  FFT fft(n);

  std::vector<float> input(n);
  for (int i = 0; i < n; ++i) {
    input[i] = std::sin(kTwoPi * bin * i / n);
  }

  std::vector<float> magnitude(fft.n_bins());
  fft.magnitude(input.data(), magnitude.data());
  REQUIRE(test::argmax(magnitude.data(), magnitude.size()) == static_cast<size_t>(bin));
  REQUIRE_THAT(magnitude[bin], WithinAbs(n / 2.0f, 0.1f));

  std::vector<float> power(fft.n_bins());
  fft.magnitude(input.data(), power.data(), true);
  REQUIRE_THAT(power[bin], WithinAbs(magnitude[bin] * magnitude[bin], 1.0f));
}

TEST_CASE("FFT is movable", "[fft]") {
  FFT a(256);
  FFT b(std::move(a));
  REQUIRE(b.n_fft() == 256);

  std::vector<float> input(256, 1.0f);
  std::vector<float> magnitude(b.n_bins());
  b.magnitude(input.data(), magnitude.data());
  REQUIRE_THAT(magnitude[0], WithinAbs(256.0f, 1e-3f));
  REQUIRE_THAT(magnitude[1], WithinAbs(0.0f, 1e-3f));
}
