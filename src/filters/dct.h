#pragma once

/// @file dct.h
/// @brief DCT-II matrices and pitch-domain liftering.

#include <cstddef>
#include <vector>

namespace chromaflow {

/// @brief Creates DCT-II matrix with orthonormal normalization.
/// @param n_output Number of output coefficients (rows)
/// @param n_input Number of input values (columns)
/// @return DCT matrix [n_output x n_input] in row-major order
/// @details Implements DCT-II with orthonormal normalization (scipy 'ortho' mode).
std::vector<float> create_dct_matrix(int n_output, int n_input);

/// @brief Creates a lifter that keeps only a band of DCT coefficients.
/// @param n Transform size
/// @param first_coeff First DCT coefficient to keep
/// @param last_coeff One past the last DCT coefficient to keep
/// @return Matrix [n x n] equal to D^T * D_cut, where D_cut zeroes rows outside
///         [first_coeff, last_coeff)
/// @throws ChromaflowException with InvalidParameter for an invalid range
std::vector<float> create_dct_lifter(int n, int first_coeff, int last_coeff);

/// @brief Applies a lifter to every frame of a row-major buffer.
/// @param frames Input frames [n_frames x n] in row-major order
/// @param n_frames Number of frames
/// @param n Values per frame
/// @param lifter Lifter matrix [n x n]
/// @return Filtered frames [n_frames x n]
std::vector<float> apply_dct_lifter(const float* frames, size_t n_frames, int n,
                                    const std::vector<float>& lifter);

}  // namespace chromaflow
