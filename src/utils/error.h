/**
 * @file error.h
 * @brief Error codes and error class used with Expected<T, Error>
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace mongokit::utils {

/**
 * @brief Error codes grouped by module
 *
 * - 0-999: general
 * - 1000-1999: configuration
 * - 2000-2999: MongoDB session and results
 * - 3000-3999: identifier codec
 */
enum class ErrorCode : int32_t {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigYamlError = 1005,
  kConfigJsonError = 1006,

  // MongoDB
  kMongoConnectionFailed = 2000,
  kMongoInvalidUri = 2001,
  kMongoNotConnected = 2002,
  kMongoInvalidReadPreference = 2003,
  kMongoCommandFailed = 2004,
  kNoResults = 2005,

  // Identifier codec
  kIdBadLength = 3000,
  kIdNotHex = 3001,
};

/**
 * @brief Human-readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value carried by Expected<T, Error>
 *
 * Holds a code, a message (defaults to the code name) and an optional
 * context string such as "file.cpp:42" or the offending input.
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] const char* what() const { return message_.c_str(); }

  // NOLINTNEXTLINE(google-explicit-constructor) - implicit conversion for logging
  operator std::string() const { return to_string(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace mongokit::utils

/**
 * @brief Create an Error with the current file:line as context
 */
#define MONGOKIT_ERROR(code, message) \
  ::mongokit::utils::MakeError((code), (message), std::string(__FILE__) + ":" + std::to_string(__LINE__))
