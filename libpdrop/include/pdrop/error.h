/**
 * @file error.h
 * @brief Error codes and result types for pdrop
 *
 * pdrop uses a Result type pattern for error handling. No exception
 * crosses the public API: every fallible operation returns a Result that
 * carries either a value or an Error attributed to its origin.
 */

#ifndef PDROP_ERROR_H
#define PDROP_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace pdrop {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  InvalidArgument = 2,
  InvalidState = 3,
  NotSupported = 6,
  Timeout = 7,
  NotFound = 9,
  AlreadyExists = 10,

  // Discovery errors (100-199)
  InitializationError = 100,
  OperationError = 101,
  CapabilityUnsupported = 102,
  StreamClosed = 103,

  // Platform errors (500-599)
  PlatformError = 500,
  ServiceUnavailable = 502,

  // Configuration errors (600-699)
  ConfigError = 600,
  ConfigParseError = 601,
  ConfigIoError = 602
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;  // Additional context
  std::string location; // Backend or component the error is attributed to

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Attach the originating component and return *this
  Error &at(std::string where) {
    location = std::move(where);
    return *this;
  }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<int> result = some_function();
 *   if (result) {
 *       int value = result.value();
 *   } else {
 *       Error err = result.error();
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return !error_.has_value(); }

  /// Check if result is error
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the error
  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define PDROP_TRY(result)                                                      \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define PDROP_REQUIRE(condition, error_code, message)                          \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::pdrop::Error(error_code, message);                              \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
PDROP_API const char *error_code_name(ErrorCode code);

/// Get description for error code
PDROP_API const char *error_code_description(ErrorCode code);

/**
 * @brief Check if an operation failing with this code may be retried
 *
 * Construction failures and capability mismatches are permanent for the
 * backend that produced them; everything else is left to caller policy.
 */
PDROP_API bool is_recoverable(ErrorCode code);

} // namespace pdrop

#endif // PDROP_ERROR_H
