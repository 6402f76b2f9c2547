#pragma once

/// @file types.h
/// @brief Common type definitions for chromaflow.

#include <cstddef>
#include <cstdint>
#include <functional>

namespace chromaflow {

/// @brief Lightweight read-only 2D matrix view.
/// @tparam T Element type
template <typename T>
class MatrixView {
 public:
  MatrixView() : data_(nullptr), rows_(0), cols_(0) {}

  /// @brief Constructs a view over existing data.
  /// @param data Pointer to row-major data
  /// @param rows Number of rows
  /// @param cols Number of columns
  MatrixView(const T* data, size_t rows, size_t cols) : data_(data), rows_(rows), cols_(cols) {}

  const T* data() const { return data_; }
  size_t rows() const { return rows_; }
  size_t cols() const { return cols_; }
  size_t size() const { return rows_ * cols_; }
  bool empty() const { return data_ == nullptr || size() == 0; }

  /// @brief Access element at (row, col) in row-major order.
  const T& at(size_t row, size_t col) const { return data_[row * cols_ + col]; }

  /// @brief Access element at (row, col) in row-major order.
  const T& operator()(size_t row, size_t col) const { return at(row, col); }

  /// @brief Returns pointer to the start of row i.
  const T* row(size_t i) const { return data_ + i * cols_; }

 private:
  const T* data_;
  size_t rows_;
  size_t cols_;
};

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  InvalidParameter,
  UnsupportedSampleRate,
  ConfigurationMismatch,
  OutOfMemory,
  InvalidState,
};

/// @brief Pitch class (0-11, C=0).
enum class PitchClass : int {
  C = 0,
  Cs = 1,
  D = 2,
  Ds = 3,
  E = 4,
  F = 5,
  Fs = 6,
  G = 7,
  Gs = 8,
  A = 9,
  As = 10,
  B = 11,
};

/// @brief Progress callback type for one-shot extraction.
/// @param progress Progress value (0.0 to 1.0)
using ProgressCallback = std::function<void(float progress)>;

/// @brief Returns the name of a pitch class.
/// @param pc Pitch class
/// @return String name (e.g., "C", "C#")
inline const char* pitch_class_name(PitchClass pc) {
  static const char* names[] = {"C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};
  return names[static_cast<int>(pc)];
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::UnsupportedSampleRate:
      return "Unsupported sample rate";
    case ErrorCode::ConfigurationMismatch:
      return "Configuration mismatch";
    case ErrorCode::OutOfMemory:
      return "Out of memory";
    case ErrorCode::InvalidState:
      return "Invalid state";
  }
  return "Unknown error";
}

}  // namespace chromaflow
