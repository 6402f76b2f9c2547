/// @file convert_test.cpp
/// @brief Tests for unit conversion functions.

#include "core/convert.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>

#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("hz_to_midi", "[convert]") {
  REQUIRE_THAT(hz_to_midi(440.0f), WithinAbs(69.0f, 1e-4f));
  REQUIRE_THAT(hz_to_midi(880.0f), WithinAbs(81.0f, 1e-4f));
  REQUIRE_THAT(hz_to_midi(261.63f), WithinAbs(60.0f, 0.01f));
  REQUIRE_THAT(hz_to_midi(0.0f), WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("hz_to_midi with tuning", "[convert]") {
  REQUIRE_THAT(hz_to_midi(442.0f, 442.0f), WithinAbs(69.0f, 1e-4f));
  REQUIRE_THAT(hz_to_midi(440.0f, 442.0f), WithinAbs(69.0f + 12.0f * std::log2(440.0f / 442.0f),
                                                     1e-4f));
}

TEST_CASE("midi_to_hz", "[convert]") {
  REQUIRE_THAT(midi_to_hz(69.0f), WithinRel(440.0f, 1e-5f));
  REQUIRE_THAT(midi_to_hz(57.0f), WithinRel(220.0f, 1e-5f));
  REQUIRE_THAT(midi_to_hz(69.0f, 432.0f), WithinRel(432.0f, 1e-5f));
}

TEST_CASE("pitch_center_frequency", "[convert]") {
  REQUIRE_THAT(pitch_center_frequency(69), WithinRel(440.0, 1e-12));
  REQUIRE_THAT(pitch_center_frequency(21), WithinRel(27.5, 1e-12));
  REQUIRE_THAT(pitch_center_frequency(81, 442.0), WithinRel(884.0, 1e-12));
}

TEST_CASE("pitch_name", "[convert]") {
  REQUIRE(pitch_name(69) == "A4");
  REQUIRE(pitch_name(60) == "C4");
  REQUIRE(pitch_name(73) == "C#5");
  REQUIRE(pitch_name(0) == "C-1");
  REQUIRE(pitch_name(127) == "G9");

  REQUIRE_THROWS_AS(pitch_name(-1), ChromaflowException);
  REQUIRE_THROWS_AS(pitch_name(128), ChromaflowException);
}

TEST_CASE("hz_to_note", "[convert]") {
  REQUIRE(hz_to_note(440.0f) == "A4");
  REQUIRE(hz_to_note(261.63f) == "C4");
  REQUIRE(hz_to_note(0.0f) == "?");
}

TEST_CASE("bin_to_hz", "[convert]") {
  REQUIRE_THAT(bin_to_hz(0, 22050, 4410), WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(bin_to_hz(88, 22050, 4410), WithinAbs(440.0f, 1e-3f));
  REQUIRE_THAT(bin_to_hz(2205, 22050, 4410), WithinAbs(11025.0f, 1e-2f));
}

TEST_CASE("frame_to_time", "[convert]") {
  REQUIRE_THAT(frame_to_time(5, 10.0f), WithinAbs(0.5f, 1e-6f));
  REQUIRE_THAT(frame_to_time(3, 2.0f), WithinAbs(1.5f, 1e-6f));
  REQUIRE_THAT(frame_to_time(3, 0.0f), WithinAbs(0.0f, 1e-6f));
}
