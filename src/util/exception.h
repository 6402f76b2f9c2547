#pragma once

/// @file exception.h
/// @brief Exception classes for chromaflow.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace chromaflow {

/// @brief Base exception class for chromaflow errors.
class ChromaflowException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit ChromaflowException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  ChromaflowException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def CHROMAFLOW_CHECK
/// @brief Throws ChromaflowException if condition is false.
#define CHROMAFLOW_CHECK(cond, code)   \
  do {                                 \
    if (!(cond)) {                     \
      throw ChromaflowException(code); \
    }                                  \
  } while (0)

/// @def CHROMAFLOW_CHECK_MSG
/// @brief Throws ChromaflowException with custom message if condition is false.
#define CHROMAFLOW_CHECK_MSG(cond, code, msg) \
  do {                                        \
    if (!(cond)) {                            \
      throw ChromaflowException(code, msg);   \
    }                                         \
  } while (0)

}  // namespace chromaflow
