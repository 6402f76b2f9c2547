/// @file quick.cpp
/// @brief Implementation of simple function API.

#include "quick.h"

#include "analysis/feature_extractor.h"

namespace chromaflow {
namespace quick {

FeatureBuffer pitch_features(const float* samples, size_t size, int sample_rate) {
  FeatureExtractor extractor;
  return extractor.extract_pitch(samples, size, sample_rate);
}

FeatureBuffer chroma_features(const float* samples, size_t size, int sample_rate,
                              const ChromaVariant& variant) {
  Recipe recipe = Recipe::default_recipe();
  recipe.chroma_variant = variant;
  FeatureExtractor extractor(recipe);
  return extractor.extract(samples, size, sample_rate).chroma.buffer;
}

}  // namespace quick
}  // namespace chromaflow
