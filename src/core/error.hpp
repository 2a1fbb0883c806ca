#pragma once

#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace mr::core {

enum class ErrorCode {
  InvalidHexFormat,
};

struct CoreError {
  ErrorCode code = ErrorCode::InvalidHexFormat;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, CoreError>;

inline auto make_error(ErrorCode code, std::string message) -> CoreError {
  return CoreError{code, std::move(message)};
}

/// Stable name for an error code, used in log lines and CLI output.
inline auto error_code_name(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::InvalidHexFormat:
      return "InvalidHexFormat";
  }
  return "Unknown";
}

}  // namespace mr::core
