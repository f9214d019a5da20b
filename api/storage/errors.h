#pragma once

#include <string>
#include <utility>

#include <aws/core/utils/Outcome.h>

namespace storage {

enum class ErrorCode {
  None,
  NotFound,
  AlreadyExists,
  InvalidSchema,
  MissingKey,
  InvalidExpression,
  InvalidParameters,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::None: return "NONE";
    case ErrorCode::NotFound: return "NOT_FOUND";
    case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
    case ErrorCode::InvalidSchema: return "INVALID_SCHEMA";
    case ErrorCode::MissingKey: return "MISSING_KEY";
    case ErrorCode::InvalidExpression: return "INVALID_EXPRESSION";
    case ErrorCode::InvalidParameters: return "INVALID_PARAMETERS";
  }
  return "UNKNOWN";
}

struct StoreError {
  ErrorCode code = ErrorCode::None;
  std::string message;

  StoreError() = default;
  StoreError(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}

  // "MISSING_KEY: item is missing key attribute order_id"
  std::string ToString() const { return std::string(ErrorCodeName(code)) + ": " + message; }
};

// Store calls report failures as values, mirroring the SDK client outcomes.
template <typename R>
using StoreOutcome = Aws::Utils::Outcome<R, StoreError>;

}  // namespace storage
