#pragma once

/// @file filterbank_config.h
/// @brief Configuration for the streaming pitch filterbank.

#include <cmath>
#include <limits>
#include <string>

#include "util/exception.h"

namespace chromaflow {

/// @brief Configuration for PitchFilterbank.
struct FilterbankConfig {
  // Input stream
  int sample_rate = 44100;    ///< Nominal input rate in Hz (one of kSampleRates)
  float tuning_hz = 440.0f;   ///< Frequency the stream's A4 is tuned to

  // Covered pitches
  int min_pitch = 21;         ///< Lowest pitch processed (A0)
  int max_pitch = 108;        ///< Highest pitch processed (C8)

  // Execution
  int resampler_block_size = 1024;  ///< Largest block handed to each resampler
  bool parallel = true;             ///< Fan work out across threads (started per call)

  // Helper methods

  /// @brief Returns the rate the resamplers treat the input as having.
  /// @details Retuning the input to A440 is done by relabeling its rate.
  /// @throws ChromaflowException with InvalidParameter if the rate does not fit in (0, INT_MAX]
  int effective_input_rate() const {
    double rate = std::round(static_cast<double>(sample_rate) * 440.0 / tuning_hz);
    CHROMAFLOW_CHECK_MSG(std::isfinite(rate) && rate >= 1.0 &&
                             rate <= static_cast<double>(std::numeric_limits<int>::max()),
                         ErrorCode::InvalidParameter,
                         "Tuning frequency " + std::to_string(tuning_hz) +
                             " Hz is out of range for a " + std::to_string(sample_rate) +
                             " Hz input");
    return static_cast<int>(rate);
  }

  /// @brief Returns the nominal to effective input rate ratio.
  double tuning_ratio() const {
    return static_cast<double>(sample_rate) / static_cast<double>(effective_input_rate());
  }

  /// @brief Returns the number of covered pitches.
  int pitch_count() const { return max_pitch - min_pitch + 1; }
};

}  // namespace chromaflow
