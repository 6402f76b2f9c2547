/// @file exception_test.cpp
/// @brief Tests for error codes and ChromaflowException.

#include "util/exception.h"

#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace chromaflow;

namespace {
void require_positive(int value) {
  CHROMAFLOW_CHECK(value > 0, ErrorCode::InvalidParameter);
}

void require_even(int value) {
  CHROMAFLOW_CHECK_MSG(value % 2 == 0, ErrorCode::ConfigurationMismatch, "value must be even");
}
}  // namespace

TEST_CASE("ChromaflowException carries its code", "[exception]") {
  ChromaflowException e(ErrorCode::UnsupportedSampleRate);
  REQUIRE(e.code() == ErrorCode::UnsupportedSampleRate);
  REQUIRE(std::string(e.what()) == "Unsupported sample rate");

  ChromaflowException custom(ErrorCode::InvalidState, "drained");
  REQUIRE(custom.code() == ErrorCode::InvalidState);
  REQUIRE(std::string(custom.what()) == "drained");
}

TEST_CASE("CHROMAFLOW_CHECK throws on failure", "[exception]") {
  REQUIRE_NOTHROW(require_positive(1));
  try {
    require_positive(0);
    FAIL("expected exception");
  } catch (const ChromaflowException& e) {
    REQUIRE(e.code() == ErrorCode::InvalidParameter);
  }
}

TEST_CASE("CHROMAFLOW_CHECK_MSG uses the message", "[exception]") {
  REQUIRE_NOTHROW(require_even(2));
  try {
    require_even(3);
    FAIL("expected exception");
  } catch (const ChromaflowException& e) {
    REQUIRE(e.code() == ErrorCode::ConfigurationMismatch);
    REQUIRE(std::string(e.what()) == "value must be even");
  }
}

TEST_CASE("error_message covers every code", "[exception]") {
  REQUIRE(std::string(error_message(ErrorCode::Ok)) == "OK");
  REQUIRE(std::string(error_message(ErrorCode::InvalidParameter)) == "Invalid parameter");
  REQUIRE(std::string(error_message(ErrorCode::ConfigurationMismatch)) ==
          "Configuration mismatch");
  REQUIRE(std::string(error_message(ErrorCode::OutOfMemory)) == "Out of memory");
  REQUIRE(std::string(error_message(ErrorCode::InvalidState)) == "Invalid state");
}

TEST_CASE("pitch_class_name", "[types]") {
  REQUIRE(std::string(pitch_class_name(PitchClass::C)) == "C");
  REQUIRE(std::string(pitch_class_name(PitchClass::Fs)) == "F#");
  REQUIRE(std::string(pitch_class_name(PitchClass::A)) == "A");
}
