#pragma once

/// @file chroma.h
/// @brief Octave folding and FFT-bin to pitch mapping.

#include <cstddef>
#include <vector>

namespace chromaflow {

/// @brief Converts frequency to pitch class (0-11, C=0).
/// @param hz Frequency in Hz
/// @param tuning_hz Frequency of A4
/// @return Pitch class (0=C, 1=C#, ..., 11=B), or -1 if hz <= 0
int hz_to_pitch_class(float hz, float tuning_hz = 440.0f);

/// @brief Folds one 128-pitch vector into 12 chroma bins.
/// @param pitch Pitch energies (128 values)
/// @param chroma Output chroma energies (12 values, overwritten)
/// @details chroma[c] is the sum of pitch[p] over all p with p % 12 == c.
void fold_to_chroma(const float* pitch, float* chroma);

/// @brief Folds a buffer of pitch vectors into chroma vectors.
/// @param pitch Pitch frames [n_frames x 128] in row-major order
/// @param n_frames Number of frames
/// @return Chroma frames [n_frames x 12] in row-major order
std::vector<float> fold_to_chroma(const float* pitch, size_t n_frames);

/// @brief Creates the FFT-bin to MIDI-pitch map.
/// @param sr Sample rate in Hz
/// @param n_fft FFT size
/// @param tuning_hz Frequency of A4
/// @return Pitch index for each of n_fft/2 + 1 bins, -1 where a bin has no pitch
/// @details Bin k maps to round(12 * log2(f_k / tuning_hz) + 69). The DC bin, bins
///          below MIDI 0 and every bin from the first one above MIDI 127 on are -1.
std::vector<int> create_bin_pitch_map(int sr, int n_fft, float tuning_hz = 440.0f);

/// @brief Accumulates FFT bins into 128-pitch vectors.
/// @param bins Bin frames [n_frames x n_bins] in row-major order
/// @param n_frames Number of frames
/// @param n_bins Bins per frame
/// @param bin_map Map from create_bin_pitch_map (n_bins entries)
/// @return Pitch frames [n_frames x 128] in row-major order
std::vector<float> fold_bins_to_pitch(const float* bins, size_t n_frames, int n_bins,
                                      const std::vector<int>& bin_map);

}  // namespace chromaflow
