#pragma once

#include <string>
#include <utility>

namespace veneer::dom {

enum class ErrorCode {
  None,
  InvalidHandle,
  ReservedAttribute,
  InvalidAttributeName,
  MissingTarget,
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::InvalidHandle:
    return "InvalidHandle";
  case ErrorCode::ReservedAttribute:
    return "ReservedAttribute";
  case ErrorCode::InvalidAttributeName:
    return "InvalidAttributeName";
  case ErrorCode::MissingTarget:
    return "MissingTarget";
  }
  return "Unknown";
}

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;

  explicit operator bool() const noexcept { return code != ErrorCode::None; }
};

inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

} // namespace veneer::dom
