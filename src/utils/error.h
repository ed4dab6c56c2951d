/**
 * @file error.h
 * @brief Error codes and error value type used with Expected<T, Error>
 *
 * Error codes are grouped by subsystem in blocks of 1000 so that a code
 * identifies its origin at a glance in logs.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace tastemix::utils {

/**
 * @brief Error codes
 */
enum class ErrorCode : std::uint16_t {
  // General (0-999)
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,
  kAlreadyExists = 4,
  kOutOfRange = 5,
  kTimeout = 6,
  kInternalError = 7,
  kNotImplemented = 8,

  // Configuration (1000-1999)
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigYamlError = 1002,
  kConfigValidationError = 1003,
  kConfigInvalidValue = 1004,

  // Storage / snapshot (2000-2999)
  kStorageDumpWriteError = 2000,
  kStorageDumpReadError = 2001,
  kStorageCRCMismatch = 2002,
  kStorageVersionMismatch = 2003,

  // Feature store (3000-3999)
  kFeatureInvalidValue = 3000,
  kTrackNotFound = 3001,
  kTrackInvalid = 3002,

  // Recommendation (4000-4999)
  kEmptyPool = 4000,
  kSeedExhausted = 4001,
  kNoMatch = 4002,
  kRunCapReached = 4003,

  // Feature extraction (5000-5999)
  kExtractionUnavailable = 5000,
  kExtractionRateLimited = 5001,
  kExtractionInvalidResponse = 5002,

  // Genre sources (6000-6999)
  kGenreSourceFailed = 6000,
  kGenreSourceInvalidResponse = 6001,

  // Profile / output (7000-7999)
  kProfileParseError = 7000,
  kPlaylistWriteError = 7001,
};

/**
 * @brief Get a stable name for an error code
 * @param code Error code
 * @return Name such as "NoMatch"
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value: code, human-readable message and optional context
 */
class Error {
 public:
  Error() = default;
  explicit Error(ErrorCode code, std::string message = "", std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Name] message (context)"
   */
  std::string to_string() const;

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace tastemix::utils
