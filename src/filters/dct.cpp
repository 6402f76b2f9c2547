#include "filters/dct.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace chromaflow {

namespace {
constexpr double kPi = 3.14159265358979323846;

using RowMajorMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
}  // namespace

std::vector<float> create_dct_matrix(int n_output, int n_input) {
  CHROMAFLOW_CHECK(n_output > 0 && n_input > 0, ErrorCode::InvalidParameter);

  std::vector<float> matrix(static_cast<size_t>(n_output) * n_input);

  // DCT-II with orthonormal normalization
  // D[k, n] = sqrt(2/N) * cos(pi * k * (2n + 1) / (2N))
  // with D[0, n] *= 1/sqrt(2) for k=0

  double scale = std::sqrt(2.0 / n_input);

  for (int k = 0; k < n_output; ++k) {
    double k_scale = (k == 0) ? scale / std::sqrt(2.0) : scale;
    for (int n = 0; n < n_input; ++n) {
      double angle = kPi * k * (2.0 * n + 1.0) / (2.0 * n_input);
      matrix[static_cast<size_t>(k) * n_input + n] = static_cast<float>(k_scale * std::cos(angle));
    }
  }

  return matrix;
}

std::vector<float> create_dct_lifter(int n, int first_coeff, int last_coeff) {
  CHROMAFLOW_CHECK(n > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK_MSG(first_coeff >= 0 && first_coeff <= last_coeff && last_coeff <= n,
                       ErrorCode::InvalidParameter, "DCT coefficient range out of bounds");

  std::vector<float> dct = create_dct_matrix(n, n);
  std::vector<float> dct_cut(dct.size(), 0.0f);
  size_t offset = static_cast<size_t>(first_coeff) * n;
  size_t count = static_cast<size_t>(last_coeff - first_coeff) * n;
  std::copy(dct.begin() + offset, dct.begin() + offset + count, dct_cut.begin() + offset);

  std::vector<float> lifter(static_cast<size_t>(n) * n);
  Eigen::Map<const RowMajorMatrixXf> dct_map(dct.data(), n, n);
  Eigen::Map<const RowMajorMatrixXf> cut_map(dct_cut.data(), n, n);
  Eigen::Map<RowMajorMatrixXf> lifter_map(lifter.data(), n, n);

  lifter_map.noalias() = dct_map.transpose() * cut_map;

  return lifter;
}

std::vector<float> apply_dct_lifter(const float* frames, size_t n_frames, int n,
                                    const std::vector<float>& lifter) {
  CHROMAFLOW_CHECK(n > 0, ErrorCode::InvalidParameter);
  CHROMAFLOW_CHECK(lifter.size() == static_cast<size_t>(n) * n, ErrorCode::ConfigurationMismatch);
  if (n_frames == 0) {
    return {};
  }
  CHROMAFLOW_CHECK(frames != nullptr, ErrorCode::InvalidParameter);

  // frames: [n_frames x n], lifter: [n x n]
  // Each output row is lifter * frame, so the whole buffer is frames * lifter^T.
  std::vector<float> result(n_frames * n);
  Eigen::Map<const RowMajorMatrixXf> frames_map(frames, static_cast<Eigen::Index>(n_frames), n);
  Eigen::Map<const RowMajorMatrixXf> lifter_map(lifter.data(), n, n);
  Eigen::Map<RowMajorMatrixXf> result_map(result.data(), static_cast<Eigen::Index>(n_frames), n);

  result_map.noalias() = frames_map * lifter_map.transpose();

  return result;
}

}  // namespace chromaflow
