#include "core/resample.h"

#include <algorithm>
#include <cmath>

#include "CDSPResampler.h"
#include "util/exception.h"

namespace chromaflow {

StreamResampler::StreamResampler(int src_sr, int target_sr, int block_size)
    : src_sr_(src_sr), target_sr_(target_sr), block_size_(block_size) {
  CHROMAFLOW_CHECK(src_sr > 0 && target_sr > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK(block_size > 0, ErrorCode::InvalidParameter);

  if (src_sr_ != target_sr_) {
    // 24-bit quality for float precision
    resampler_ = std::make_unique<r8b::CDSPResampler24>(
        static_cast<double>(src_sr_), static_cast<double>(target_sr_), block_size_);
    in_block_.resize(static_cast<size_t>(block_size_));
  }
}

StreamResampler::~StreamResampler() = default;
StreamResampler::StreamResampler(StreamResampler&&) noexcept = default;
StreamResampler& StreamResampler::operator=(StreamResampler&&) noexcept = default;

void StreamResampler::process(const float* samples, size_t size, std::vector<float>& out) {
  if (size == 0) {
    return;
  }

  if (passthrough()) {
    out.insert(out.end(), samples, samples + size);
    return;
  }

  size_t remaining = size;
  const float* input_ptr = samples;

  while (remaining > 0) {
    int block_len = static_cast<int>(std::min(remaining, static_cast<size_t>(block_size_)));

    // r8brain works on doubles
    for (int i = 0; i < block_len; ++i) {
      in_block_[i] = static_cast<double>(input_ptr[i]);
    }

    double* output_ptr = nullptr;
    int output_len = resampler_->process(in_block_.data(), block_len, output_ptr);

    if (output_len > 0 && output_ptr != nullptr) {
      out.reserve(out.size() + static_cast<size_t>(output_len));
      for (int i = 0; i < output_len; ++i) {
        out.push_back(static_cast<float>(output_ptr[i]));
      }
    }

    input_ptr += block_len;
    remaining -= block_len;
  }
}

std::vector<float> StreamResampler::process(const float* samples, size_t size) {
  std::vector<float> out;
  process(samples, size, out);
  return out;
}

void StreamResampler::flush(std::vector<float>& out) {
  int length = flush_length();
  if (length <= 0) {
    return;
  }
  std::vector<float> zeros(static_cast<size_t>(length), 0.0f);
  process(zeros.data(), zeros.size(), out);
}

void StreamResampler::reset() {
  if (resampler_) {
    resampler_->clear();
  }
}

int StreamResampler::flush_length() const {
  if (passthrough()) {
    return 0;
  }
  return resampler_->getInLenBeforeOutPos(0);
}

int StreamResampler::output_latency() const {
  if (passthrough()) {
    return 0;
  }
  return resampler_->getLatency();
}

std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr) {
  CHROMAFLOW_CHECK(src_sr > 0 && target_sr > 0, ErrorCode::InvalidParameter);

  if (size == 0) {
    return {};
  }

  // If sample rates are equal, just copy
  if (src_sr == target_sr) {
    return std::vector<float>(samples, samples + size);
  }

  StreamResampler resampler(src_sr, target_sr);
  double ratio = static_cast<double>(target_sr) / static_cast<double>(src_sr);
  size_t expected_size = static_cast<size_t>(std::round(size * ratio));

  std::vector<float> result;
  result.reserve(expected_size + 1);
  resampler.process(samples, size, result);
  resampler.flush(result);

  // The flush may stop a few samples short of the expected length
  if (result.size() < expected_size) {
    result.resize(expected_size, 0.0f);
  } else if (result.size() > expected_size) {
    result.resize(expected_size);
  }

  return result;
}

}  // namespace chromaflow
