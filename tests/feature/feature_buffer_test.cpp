/// @file feature_buffer_test.cpp
/// @brief Tests for FeatureBuffer.

#include "feature/feature_buffer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace chromaflow;
using Catch::Matchers::WithinAbs;

TEST_CASE("FeatureBuffer append and access", "[feature_buffer]") {
  FeatureBuffer buffer = make_chroma_buffer(10.0f);
  REQUIRE(buffer.dims() == 12);
  REQUIRE(buffer.empty());
  REQUIRE(buffer.n_frames() == 0);

  ChromaVector a{};
  a[0] = 1.0f;
  ChromaVector b{};
  b[11] = 2.0f;
  buffer.append(a);
  buffer.append(b);

  REQUIRE(buffer.n_frames() == 2);
  REQUIRE(buffer.size() == 24);
  REQUIRE(buffer.at(0, 0) == 1.0f);
  REQUIRE(buffer.at(1, 11) == 2.0f);
  REQUIRE(buffer.frame(1)[11] == 2.0f);
  REQUIRE(buffer.vector_at<12>(1) == b);
  REQUIRE_THAT(buffer.duration(), WithinAbs(0.2f, 1e-6f));

  buffer.at(0, 5) = 4.0f;
  REQUIRE(buffer.at(0, 5) == 4.0f);
}

TEST_CASE("FeatureBuffer is bounds checked", "[feature_buffer]") {
  FeatureBuffer buffer = make_pitch_buffer(10.0f);
  PitchVector v{};
  buffer.append(v);

  REQUIRE_THROWS_AS(buffer.at(1, 0), ChromaflowException);
  REQUIRE_THROWS_AS(buffer.at(0, 128), ChromaflowException);
  REQUIRE_THROWS_AS(buffer.vector_at<128>(3), ChromaflowException);
  REQUIRE_THROWS_AS(buffer.vector_at<12>(0), ChromaflowException);

  ChromaVector wrong{};
  REQUIRE_THROWS_AS(buffer.append(wrong), ChromaflowException);
}

TEST_CASE("FeatureBuffer rejects invalid construction", "[feature_buffer]") {
  REQUIRE_THROWS_AS(FeatureBuffer(0, 10.0f), ChromaflowException);
  REQUIRE_THROWS_AS(FeatureBuffer(12, 0.0f), ChromaflowException);
  REQUIRE_THROWS_AS(FeatureBuffer::from_vector(std::vector<float>(13, 0.0f), 12, 10.0f),
                    ChromaflowException);

  FeatureBuffer buffer(12, 10.0f);
  REQUIRE_THROWS_AS(buffer.set_feature_rate(-1.0f), ChromaflowException);
  buffer.set_feature_rate(2.0f);
  REQUIRE(buffer.feature_rate() == 2.0f);
}

TEST_CASE("FeatureBuffer append buffer", "[feature_buffer]") {
  auto a = FeatureBuffer::from_vector({1.0f, 2.0f, 3.0f, 4.0f}, 2, 10.0f);
  auto b = FeatureBuffer::from_vector({5.0f, 6.0f}, 2, 10.0f);
  a.append(b);

  REQUIRE(a.n_frames() == 3);
  REQUIRE(a.at(2, 1) == 6.0f);

  auto c = FeatureBuffer::from_vector({1.0f, 2.0f, 3.0f}, 3, 10.0f);
  REQUIRE_THROWS_AS(a.append(c), ChromaflowException);
}

TEST_CASE("FeatureBuffer to_matrix", "[feature_buffer]") {
  auto buffer = FeatureBuffer::from_vector({1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}, 3, 10.0f);
  MatrixView<float> matrix = buffer.to_matrix();

  REQUIRE(matrix.rows() == 2);
  REQUIRE(matrix.cols() == 3);
  REQUIRE(matrix(1, 0) == 4.0f);
  REQUIRE(matrix.row(0)[2] == 3.0f);
  REQUIRE_FALSE(matrix.empty());

  REQUIRE(FeatureBuffer(3, 10.0f).to_matrix().empty());
}
