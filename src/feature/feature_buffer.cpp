/// @file feature_buffer.cpp
/// @brief Implementation of FeatureBuffer.

#include "feature/feature_buffer.h"

#include <string>
#include <utility>

#include "util/exception.h"

namespace chromaflow {

FeatureBuffer::FeatureBuffer() : dims_(0), feature_rate_(0.0f) {}

FeatureBuffer::FeatureBuffer(size_t dims, float feature_rate)
    : dims_(dims), feature_rate_(feature_rate) {
  CHROMAFLOW_CHECK(dims > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK_MSG(feature_rate > 0.0f, ErrorCode::InvalidParameter,
                       "Feature rate must be positive");
}

FeatureBuffer FeatureBuffer::from_vector(std::vector<float> data, size_t dims,
                                         float feature_rate) {
  FeatureBuffer buffer(dims, feature_rate);
  CHROMAFLOW_CHECK_MSG(data.size() % dims == 0, ErrorCode::ConfigurationMismatch,
                       "Data size is not a multiple of the vector length");
  buffer.data_ = std::move(data);
  return buffer;
}

void FeatureBuffer::set_feature_rate(float feature_rate) {
  CHROMAFLOW_CHECK_MSG(feature_rate > 0.0f, ErrorCode::InvalidParameter,
                       "Feature rate must be positive");
  feature_rate_ = feature_rate;
}

float FeatureBuffer::at(size_t frame, size_t dim) const {
  CHROMAFLOW_CHECK(dim < dims_, ErrorCode::InvalidParameter);
  return data_[checked_frame(frame) * dims_ + dim];
}

float& FeatureBuffer::at(size_t frame, size_t dim) {
  CHROMAFLOW_CHECK(dim < dims_, ErrorCode::InvalidParameter);
  return data_[checked_frame(frame) * dims_ + dim];
}

void FeatureBuffer::append(const float* values) {
  CHROMAFLOW_CHECK(dims_ > 0, ErrorCode::InvalidState);
  CHROMAFLOW_CHECK(values != nullptr, ErrorCode::InvalidParameter);
  data_.insert(data_.end(), values, values + dims_);
}

void FeatureBuffer::append(const FeatureBuffer& other) {
  if (other.empty()) {
    return;
  }
  check_dims(other.dims_);
  data_.insert(data_.end(), other.data_.begin(), other.data_.end());
}

float FeatureBuffer::duration() const {
  if (feature_rate_ <= 0.0f) return 0.0f;
  return static_cast<float>(n_frames()) / feature_rate_;
}

void FeatureBuffer::check_dims(size_t n) const {
  CHROMAFLOW_CHECK_MSG(n == dims_, ErrorCode::ConfigurationMismatch,
                       "Vector length " + std::to_string(n) + " does not match buffer length " +
                           std::to_string(dims_));
}

size_t FeatureBuffer::checked_frame(size_t i) const {
  CHROMAFLOW_CHECK_MSG(i < n_frames(), ErrorCode::InvalidParameter,
                       "Frame index out of range: " + std::to_string(i));
  return i;
}

}  // namespace chromaflow
