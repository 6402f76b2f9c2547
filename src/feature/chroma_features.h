#pragma once

/// @file chroma_features.h
/// @brief Chroma feature variants computed from pitch buffers.

#include "feature/compression.h"
#include "feature/feature_buffer.h"
#include "feature/normalization.h"
#include "feature/quantization.h"
#include "feature/smoothing.h"

namespace chromaflow {

/// @brief Chroma feature flavor.
enum class ChromaVariantType {
  CP,    ///< Chroma pitch: optional compression, fold, optional normalization
  CENS,  ///< Energy normalized statistics: fold, l1 normalize, quantize, smooth
  CRP,   ///< DCT-reduced log pitch: lifter, fold, l2 normalize, smooth
};

/// @brief Chroma variant and its settings.
/// @details Only the settings relevant to type are read.
struct ChromaVariant {
  ChromaVariantType type = ChromaVariantType::CP;

  // CP
  bool use_compression = true;                                ///< Compress pitch values first
  CompressionSettings compression;                            ///< Default {1, 100}
  bool use_normalization = true;                              ///< Normalize chroma vectors
  NormalizationSettings normalization;                        ///< Default l2, 0.001

  // CENS
  QuantizationSettings quantization;                          ///< Default 4 steps

  // CENS and CRP
  bool use_smoothing = false;                                 ///< Smooth the chroma buffer
  SmoothingSettings smoothing;

  // CRP
  int first_coefficient = 55;                                 ///< First DCT coefficient kept
  int last_coefficient = 120;                                 ///< One past the last kept

  /// @brief Default chroma pitch variant.
  static ChromaVariant cp() { return ChromaVariant(); }

  /// @brief CENS variant with smoothing.
  static ChromaVariant cens(const QuantizationSettings& quantization = QuantizationSettings(),
                            const SmoothingSettings& smoothing = SmoothingSettings());

  /// @brief CRP variant without smoothing.
  static ChromaVariant crp(int first_coefficient = 55, int last_coefficient = 120);
};

/// @brief Computes chroma pitch (CP) features.
/// @param pitch Pitch buffer [n_frames x 128]
/// @param variant Variant settings
/// @return Chroma buffer at the pitch buffer's rate
FeatureBuffer extract_cp(const FeatureBuffer& pitch, const ChromaVariant& variant);

/// @brief Computes CENS features.
/// @return Chroma buffer, downsampled if smoothing is enabled
FeatureBuffer extract_cens(const FeatureBuffer& pitch, const ChromaVariant& variant);

/// @brief Computes CRP features.
/// @return Chroma buffer, downsampled if smoothing is enabled
FeatureBuffer extract_crp(const FeatureBuffer& pitch, const ChromaVariant& variant);

/// @brief Computes chroma features of the variant's type.
/// @throws ChromaflowException with ConfigurationMismatch if pitch.dims() != 128
FeatureBuffer extract_chroma(const FeatureBuffer& pitch,
                             const ChromaVariant& variant = ChromaVariant());

}  // namespace chromaflow
