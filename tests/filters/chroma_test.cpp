/// @file chroma_test.cpp
/// @brief Tests for chroma folding and bin-to-pitch mapping.

#include "filters/chroma.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "core/sample_rate.h"
#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

TEST_CASE("hz_to_pitch_class", "[chroma]") {
  REQUIRE(hz_to_pitch_class(440.0f) == 9);
  REQUIRE(hz_to_pitch_class(261.63f) == 0);
  REQUIRE(hz_to_pitch_class(27.5f) == 9);
  REQUIRE(hz_to_pitch_class(0.0f) == -1);
  REQUIRE(hz_to_pitch_class(442.0f, 442.0f) == 9);
}

TEST_CASE("one-hot pitch folds to one-hot chroma", "[chroma]") {
  for (int p = 0; p < kNumPitches; ++p) {
    std::vector<float> pitch(kNumPitches, 0.0f);
    pitch[p] = 1.0f;

    std::vector<float> chroma(kNumChroma, -1.0f);
    fold_to_chroma(pitch.data(), chroma.data());

    for (int c = 0; c < kNumChroma; ++c) {
      REQUIRE(chroma[c] == (c == p % kNumChroma ? 1.0f : 0.0f));
    }
  }
}

TEST_CASE("zero pitch folds to zero chroma", "[chroma]") {
  std::vector<float> pitch(kNumPitches * 3, 0.0f);
  auto chroma = fold_to_chroma(pitch.data(), 3);

  REQUIRE(chroma.size() == static_cast<size_t>(kNumChroma * 3));
  for (float v : chroma) {
    REQUIRE(v == 0.0f);
  }
}

TEST_CASE("fold sums every octave", "[chroma]") {
  std::vector<float> pitch(kNumPitches, 1.0f);
  auto chroma = fold_to_chroma(pitch.data(), 1);

  // 128 = 10 * 12 + 8: classes C..G appear 11 times, G#..B 10 times
  for (int c = 0; c < kNumChroma; ++c) {
    REQUIRE_THAT(chroma[c], WithinAbs(c < 8 ? 11.0f : 10.0f, 1e-6f));
  }
}

TEST_CASE("bin pitch map", "[chroma]") {
  // 5 Hz bins
  auto map = create_bin_pitch_map(22050, 4410);
  REQUIRE(map.size() == 2206);

  REQUIRE(map[0] == -1);  // DC
  REQUIRE(map[1] == -1);  // 5 Hz is below pitch 0
  REQUIRE(map[88] == 69);
  REQUIRE(map[87] == 69);
  REQUIRE(map[89] == 69);
  REQUIRE(map[2205] == 125);

  for (size_t k = 1; k < map.size(); ++k) {
    if (map[k - 1] >= 0) {
      REQUIRE(map[k] >= map[k - 1]);
    }
  }
}

TEST_CASE("bin pitch map stops above pitch 127", "[chroma]") {
  auto map = create_bin_pitch_map(44100, 4096);
  REQUIRE(map.back() == -1);
  for (int pitch : map) {
    REQUIRE(pitch < kNumPitches);
  }
}

TEST_CASE("fold_bins_to_pitch", "[chroma]") {
  auto map = create_bin_pitch_map(22050, 4410);
  int n_bins = static_cast<int>(map.size());

  std::vector<float> bins(2 * n_bins, 0.0f);
  bins[87] = 1.0f;
  bins[88] = 2.0f;
  bins[n_bins + 176] = 3.0f;  // 880 Hz

  auto pitch = fold_bins_to_pitch(bins.data(), 2, n_bins, map);
  REQUIRE(pitch.size() == static_cast<size_t>(2 * kNumPitches));
  REQUIRE_THAT(pitch[69], WithinAbs(3.0f, 1e-6f));
  REQUIRE_THAT(pitch[kNumPitches + 81], WithinAbs(3.0f, 1e-6f));

  std::vector<int> wrong(10, -1);
  REQUIRE_THROWS_AS(fold_bins_to_pitch(bins.data(), 2, n_bins, wrong), ChromaflowException);
}
