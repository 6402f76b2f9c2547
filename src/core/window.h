#pragma once

/// @file window.h
/// @brief Window function generators.

#include <vector>

namespace chromaflow {

/// @brief Window function type.
enum class WindowType {
  Hann,
  Hamming,
  Blackman,
  Rectangular,
};

/// @brief Creates a window of the specified type.
/// @param type Window type
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> create_window(WindowType type, int length);

/// @brief Creates a symmetric Hann (raised cosine) window.
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> hann_window(int length);

/// @brief Creates a Hamming window.
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> hamming_window(int length);

/// @brief Creates a Blackman window.
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> blackman_window(int length);

/// @brief Creates a rectangular (boxcar) window.
/// @param length Window length in samples
/// @return Vector containing all 1.0 values
std::vector<float> rectangular_window(int length);

/// @brief Creates the Hann low-pass kernel used for feature smoothing.
/// @param length Kernel length (> 0)
/// @return Coefficients 0.5 * (1 - cos(2*pi*(i+1)/(length+1))), normalized to unit sum
/// @details The end points are excluded so no tap is zero.
std::vector<float> smoothing_kernel(int length);

/// @brief Scales a window so that its coefficients sum to target.
/// @param window Window to scale in place
/// @param target Desired sum
void scale_to_sum(std::vector<float>& window, float target);

/// @brief Rotates a frame so that its center sample moves to index 0.
/// @param frame Frame to rotate in place
void apply_zero_phase(std::vector<float>& frame);

}  // namespace chromaflow
