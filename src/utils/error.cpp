/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

#include <sstream>

namespace mongokit::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    // General
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    // Configuration
    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    // MongoDB
    case ErrorCode::kMongoConnectionFailed:
      return "MongoDB connection failed";
    case ErrorCode::kMongoInvalidUri:
      return "Invalid MongoDB URI";
    case ErrorCode::kMongoNotConnected:
      return "MongoDB not connected";
    case ErrorCode::kMongoInvalidReadPreference:
      return "Invalid read preference";
    case ErrorCode::kMongoCommandFailed:
      return "MongoDB command failed";
    case ErrorCode::kNoResults:
      return "No results found";

    // Identifier codec
    case ErrorCode::kIdBadLength:
      return "ID must be 24 characters long";
    case ErrorCode::kIdNotHex:
      return "ID not hexadecimal";

    default:
      return "Unknown error code";
  }
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << "[" << ErrorCodeToString(code_) << " (" << static_cast<int32_t>(code_) << ")] " << message_;
  if (!context_.empty()) {
    oss << " (context: " << context_ << ")";
  }
  return oss.str();
}

}  // namespace mongokit::utils
