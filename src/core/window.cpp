/// @file window.cpp
/// @brief Implementation of window functions.

#include "core/window.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "util/exception.h"

namespace chromaflow {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
}  // namespace

std::vector<float> create_window(WindowType type, int length) {
  switch (type) {
    case WindowType::Hann:
      return hann_window(length);
    case WindowType::Hamming:
      return hamming_window(length);
    case WindowType::Blackman:
      return blackman_window(length);
    case WindowType::Rectangular:
      return rectangular_window(length);
  }
  return hann_window(length);  // default
}

std::vector<float> hann_window(int length) {
  CHROMAFLOW_CHECK(length > 0, ErrorCode::InvalidParameter);
  if (length == 1) return {1.0f};

  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = static_cast<float>(0.5 - 0.5 * std::cos(kTwoPi * i / (length - 1)));
  }
  return window;
}

std::vector<float> hamming_window(int length) {
  CHROMAFLOW_CHECK(length > 0, ErrorCode::InvalidParameter);
  if (length == 1) return {1.0f};

  std::vector<float> window(length);
  for (int i = 0; i < length; ++i) {
    window[i] = static_cast<float>(0.54 - 0.46 * std::cos(kTwoPi * i / (length - 1)));
  }
  return window;
}

std::vector<float> blackman_window(int length) {
  CHROMAFLOW_CHECK(length > 0, ErrorCode::InvalidParameter);
  if (length == 1) return {1.0f};

  std::vector<float> window(length);
  constexpr double a0 = 0.42;
  constexpr double a1 = 0.5;
  constexpr double a2 = 0.08;
  for (int i = 0; i < length; ++i) {
    double t = static_cast<double>(i) / (length - 1);
    window[i] = static_cast<float>(a0 - a1 * std::cos(kTwoPi * t) + a2 * std::cos(2.0 * kTwoPi * t));
  }
  return window;
}

std::vector<float> rectangular_window(int length) {
  CHROMAFLOW_CHECK(length > 0, ErrorCode::InvalidParameter);
  return std::vector<float>(length, 1.0f);
}

std::vector<float> smoothing_kernel(int length) {
  CHROMAFLOW_CHECK(length > 0, ErrorCode::InvalidParameter);

  std::vector<float> kernel(length);
  for (int i = 0; i < length; ++i) {
    kernel[i] = static_cast<float>(0.5 * (1.0 - std::cos(kTwoPi * (i + 1) / (length + 1))));
  }
  scale_to_sum(kernel, 1.0f);
  return kernel;
}

void scale_to_sum(std::vector<float>& window, float target) {
  float sum = std::accumulate(window.begin(), window.end(), 0.0f);
  if (sum == 0.0f) return;

  float scale = target / sum;
  for (float& w : window) {
    w *= scale;
  }
}

void apply_zero_phase(std::vector<float>& frame) {
  if (frame.size() < 2) return;
  std::rotate(frame.begin(), frame.begin() + frame.size() / 2, frame.end());
}

}  // namespace chromaflow
