/// @file math_utils_test.cpp
/// @brief Tests for math utility functions.

#include "util/math_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

TEST_CASE("sum_of_squares", "[math_utils]") {
  std::vector<double> data = {1.0, -2.0, 3.0};
  REQUIRE_THAT(sum_of_squares(data.data(), data.size()), WithinAbs(14.0, 1e-12));
}

TEST_CASE("norm_l1 and norm_l2", "[math_utils]") {
  std::vector<float> data = {3.0f, -4.0f};
  REQUIRE_THAT(norm_l1(data.data(), data.size()), WithinAbs(7.0f, 1e-6f));
  REQUIRE_THAT(norm_l2(data.data(), data.size()), WithinAbs(5.0f, 1e-6f));

  std::vector<float> empty;
  REQUIRE_THAT(norm_l2(empty.data(), empty.size()), WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("ceil_div", "[math_utils]") {
  REQUIRE(ceil_div(0, 5) == 0);
  REQUIRE(ceil_div(10, 5) == 2);
  REQUIRE(ceil_div(11, 5) == 3);
  REQUIRE(ceil_div(1, 5) == 1);
}

TEST_CASE("round_to_int", "[math_utils]") {
  REQUIRE(round_to_int(176.4) == 176);
  REQUIRE(round_to_int(264.6) == 265);
  REQUIRE(round_to_int(2.5) == 3);
  REQUIRE(round_to_int(-2.5) == -3);
}

TEST_CASE("max_value", "[math_utils]") {
  std::vector<float> data = {-1.0f, 4.0f, 2.0f};
  REQUIRE_THAT(max_value(data.data(), data.size()), WithinAbs(4.0f, 1e-6f));
  REQUIRE_THAT(max_value(data.data(), 0), WithinAbs(0.0f, 1e-6f));
}
