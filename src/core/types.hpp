#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace termctl {

using json = nlohmann::json;

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error taxonomy shared by every layer. Names returned by to_string() are the wire names.
enum class ErrorCode {
  ShellUnavailable,  // No usable shell found
  SpawnFailed,       // OS refused to create the process
  NotFound,
  NotADirectory,
  NotAFile,
  OutOfRange,  // Invalid line addressing
  PermissionDenied,
  UnknownTool,
  InvalidArgument,  // Malformed request shape
  IoError,          // Unexpected filesystem failure
  Internal          // Exception caught at the dispatcher boundary
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::Internal;
  std::string message;

  json to_json() const {
    return {{"code", to_string(code)}, {"message", message}};
  }
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(ErrorCode code, std::string message) {
    return Result{std::nullopt, Error{code, std::move(message)}};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Replace invalid UTF-8 sequences with U+FFFD so the text can be put into json
std::string sanitize_utf8(const std::string &input);

// ISO-8601 local time with milliseconds, e.g. 2024-05-01T12:30:00.123
std::string format_timestamp(const Timestamp &ts);

}  // namespace termctl
