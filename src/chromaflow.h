#pragma once

/// @file chromaflow.h
/// @brief Main header for chromaflow - pitch and chroma feature extraction library.
/// @details Include this file to access all chromaflow functionality.

// Version information
#define CHROMAFLOW_VERSION_MAJOR 1
#define CHROMAFLOW_VERSION_MINOR 0
#define CHROMAFLOW_VERSION_PATCH 0
#define CHROMAFLOW_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/math_utils.h"
#include "util/parallel.h"
#include "util/types.h"

// Core
#include "core/convert.h"
#include "core/fft.h"
#include "core/resample.h"
#include "core/sample_rate.h"
#include "core/window.h"

// Filters
#include "filters/chroma.h"
#include "filters/dct.h"
#include "filters/iir.h"
#include "filters/pitch_filter_table.h"

// Features
#include "feature/chroma_features.h"
#include "feature/compression.h"
#include "feature/decibel.h"
#include "feature/feature_buffer.h"
#include "feature/feature_filter.h"
#include "feature/normalization.h"
#include "feature/quantization.h"
#include "feature/smoothing.h"
#include "feature/stft_pitch.h"

// Streaming
#include "streaming/filterbank_config.h"
#include "streaming/frame_energy.h"
#include "streaming/pitch_filterbank.h"

// Analysis
#include "analysis/feature_extractor.h"

// Quick API
#include "quick.h"

namespace chromaflow {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return CHROMAFLOW_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return CHROMAFLOW_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return CHROMAFLOW_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return CHROMAFLOW_VERSION_PATCH; }

}  // namespace chromaflow
