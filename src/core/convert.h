#pragma once

/// @file convert.h
/// @brief Unit conversion functions for pitch and frequency.

#include <string>

namespace chromaflow {

/// @brief Converts Hz to MIDI note number.
/// @param hz Frequency in Hz
/// @param tuning_hz Frequency of A4 (MIDI 69)
/// @return MIDI note number (A4 = 69), 0 for non-positive input
float hz_to_midi(float hz, float tuning_hz = 440.0f);

/// @brief Converts MIDI note number to Hz.
/// @param midi MIDI note number
/// @param tuning_hz Frequency of A4 (MIDI 69)
/// @return Frequency in Hz
float midi_to_hz(float midi, float tuning_hz = 440.0f);

/// @brief Returns the center frequency of an integer MIDI pitch.
/// @param pitch MIDI pitch (0-127)
/// @param tuning_hz Frequency of A4 (MIDI 69)
/// @return Frequency in Hz
double pitch_center_frequency(int pitch, double tuning_hz = 440.0);

/// @brief Returns the scientific name of a MIDI pitch.
/// @param pitch MIDI pitch (0-127)
/// @return Name such as "A4" or "C#-1"
std::string pitch_name(int pitch);

/// @brief Converts Hz to note name.
/// @param hz Frequency in Hz
/// @return Note name (e.g., "A4", "C#5"), "?" for non-positive input
std::string hz_to_note(float hz);

/// @brief Converts FFT bin index to Hz.
/// @param bin Bin index
/// @param sr Sample rate in Hz
/// @param n_fft FFT size
/// @return Bin center frequency in Hz
float bin_to_hz(int bin, int sr, int n_fft);

/// @brief Converts a feature frame index to time in seconds.
/// @param frame Frame index
/// @param feature_rate Frames per second
/// @return Time in seconds
float frame_to_time(int frame, float feature_rate);

}  // namespace chromaflow
