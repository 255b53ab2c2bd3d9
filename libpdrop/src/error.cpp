/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "pdrop/error.h"
#include <sstream>

namespace pdrop {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";

  case ErrorCode::InitializationError:
    return "InitializationError";
  case ErrorCode::OperationError:
    return "OperationError";
  case ErrorCode::CapabilityUnsupported:
    return "CapabilityUnsupported";
  case ErrorCode::StreamClosed:
    return "StreamClosed";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";

  case ErrorCode::ConfigError:
    return "ConfigError";
  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::ConfigIoError:
    return "ConfigIoError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::NotFound:
    return "Requested item not found";
  case ErrorCode::AlreadyExists:
    return "Item already exists";

  case ErrorCode::InitializationError:
    return "Backend construction failed";
  case ErrorCode::OperationError:
    return "Backend lifecycle operation failed";
  case ErrorCode::CapabilityUnsupported:
    return "Backend does not declare this capability";
  case ErrorCode::StreamClosed:
    return "Backend event stream ended while active";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";

  case ErrorCode::ConfigError:
    return "Invalid configuration";
  case ErrorCode::ConfigParseError:
    return "Configuration file could not be parsed";
  case ErrorCode::ConfigIoError:
    return "Configuration file could not be read or written";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::InitializationError:
  case ErrorCode::CapabilityUnsupported:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace pdrop
