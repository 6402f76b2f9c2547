#include "feature/smoothing.h"

#include <Eigen/Core>
#include <utility>
#include <vector>

#include "core/window.h"
#include "feature/normalization.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace chromaflow {

namespace {
using RowMajorMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr float kSmoothingNormThreshold = 0.001f;
}  // namespace

FeatureBuffer smooth(const FeatureBuffer& buffer, const SmoothingSettings& settings) {
  CHROMAFLOW_CHECK_MSG(settings.window_size > 0, ErrorCode::InvalidParameter,
                       "Smoothing window size must be positive");
  CHROMAFLOW_CHECK_MSG(settings.downsample_factor > 0, ErrorCode::InvalidParameter,
                       "Downsample factor must be positive");
  CHROMAFLOW_CHECK(buffer.dims() > 0, ErrorCode::InvalidParameter);

  const size_t n_frames = buffer.n_frames();
  const size_t dims = buffer.dims();
  const size_t window = static_cast<size_t>(settings.window_size);
  const size_t factor = static_cast<size_t>(settings.downsample_factor);
  const float out_rate = buffer.feature_rate() / static_cast<float>(factor);

  FeatureBuffer result(dims, out_rate);
  if (n_frames == 0) {
    return result;
  }

  // Channel-major copy [dims x (n_frames + window - 1)], zero-padded at the end
  const size_t padded = n_frames + window - 1;
  RowMajorMatrixXf channels = RowMajorMatrixXf::Zero(dims, padded);
  Eigen::Map<const RowMajorMatrixXf> frames(buffer.data(), n_frames, dims);
  channels.leftCols(n_frames) = frames.transpose();

  std::vector<float> kernel = smoothing_kernel(settings.window_size);
  Eigen::Map<const Eigen::RowVectorXf> kernel_map(kernel.data(), kernel.size());

  const size_t out_frames = ceil_div(n_frames, factor);
  std::vector<float> out(out_frames * dims);
  Eigen::Map<RowMajorMatrixXf> out_map(out.data(), out_frames, dims);

  for (size_t n = 0; n < out_frames; ++n) {
    // Filter taps for output n span input frames [n * factor, n * factor + window)
    out_map.row(n).noalias() =
        (channels.middleCols(n * factor, window) * kernel_map.transpose()).transpose();
  }

  for (size_t n = 0; n < out_frames; ++n) {
    normalize_vector(out.data() + n * dims, dims, NormSpace::L2, kSmoothingNormThreshold);
  }

  return FeatureBuffer::from_vector(std::move(out), dims, out_rate);
}

}  // namespace chromaflow
