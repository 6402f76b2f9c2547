#include "feature/chroma_features.h"

#include <utility>
#include <vector>

#include "filters/chroma.h"
#include "filters/dct.h"
#include "util/exception.h"

namespace chromaflow {

namespace {

constexpr float kCensNormThreshold = 0.001f;
constexpr float kCrpNormThreshold = 0.00001f;

void check_pitch_buffer(const FeatureBuffer& pitch) {
  CHROMAFLOW_CHECK_MSG(pitch.dims() == static_cast<size_t>(kNumPitches),
                       ErrorCode::ConfigurationMismatch,
                       "Chroma extraction requires 128-pitch vectors");
}

FeatureBuffer fold(const float* pitch, size_t n_frames, float feature_rate) {
  return FeatureBuffer::from_vector(fold_to_chroma(pitch, n_frames), kNumChroma, feature_rate);
}

}  // namespace

ChromaVariant ChromaVariant::cens(const QuantizationSettings& quantization,
                                  const SmoothingSettings& smoothing) {
  ChromaVariant variant;
  variant.type = ChromaVariantType::CENS;
  variant.quantization = quantization;
  variant.use_smoothing = true;
  variant.smoothing = smoothing;
  return variant;
}

ChromaVariant ChromaVariant::crp(int first_coefficient, int last_coefficient) {
  ChromaVariant variant;
  variant.type = ChromaVariantType::CRP;
  variant.first_coefficient = first_coefficient;
  variant.last_coefficient = last_coefficient;
  return variant;
}

FeatureBuffer extract_cp(const FeatureBuffer& pitch, const ChromaVariant& variant) {
  check_pitch_buffer(pitch);

  FeatureBuffer source = pitch;
  if (variant.use_compression) {
    compress(source, variant.compression);
  }

  FeatureBuffer chroma = fold(source.data(), source.n_frames(), source.feature_rate());
  if (variant.use_normalization) {
    normalize(chroma, variant.normalization);
  }
  return chroma;
}

FeatureBuffer extract_cens(const FeatureBuffer& pitch, const ChromaVariant& variant) {
  check_pitch_buffer(pitch);

  FeatureBuffer chroma = fold(pitch.data(), pitch.n_frames(), pitch.feature_rate());
  normalize(chroma, NormalizationSettings::lp_norm(NormSpace::L1, kCensNormThreshold));
  quantize(chroma, variant.quantization);

  if (!variant.use_smoothing) {
    return chroma;
  }
  return smooth(chroma, variant.smoothing);
}

FeatureBuffer extract_crp(const FeatureBuffer& pitch, const ChromaVariant& variant) {
  check_pitch_buffer(pitch);

  std::vector<float> lifter =
      create_dct_lifter(kNumPitches, variant.first_coefficient, variant.last_coefficient);
  std::vector<float> reduced =
      apply_dct_lifter(pitch.data(), pitch.n_frames(), kNumPitches, lifter);

  FeatureBuffer chroma = fold(reduced.data(), pitch.n_frames(), pitch.feature_rate());
  normalize(chroma, NormalizationSettings::lp_norm(NormSpace::L2, kCrpNormThreshold));

  if (!variant.use_smoothing) {
    return chroma;
  }
  return smooth(chroma, variant.smoothing);
}

FeatureBuffer extract_chroma(const FeatureBuffer& pitch, const ChromaVariant& variant) {
  switch (variant.type) {
    case ChromaVariantType::CP:
      return extract_cp(pitch, variant);
    case ChromaVariantType::CENS:
      return extract_cens(pitch, variant);
    case ChromaVariantType::CRP:
      return extract_crp(pitch, variant);
  }
  return extract_cp(pitch, variant);
}

}  // namespace chromaflow
