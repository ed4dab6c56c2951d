/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

namespace tastemix::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kNotImplemented:
      return "NotImplemented";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kStorageDumpWriteError:
      return "StorageDumpWriteError";
    case ErrorCode::kStorageDumpReadError:
      return "StorageDumpReadError";
    case ErrorCode::kStorageCRCMismatch:
      return "StorageCRCMismatch";
    case ErrorCode::kStorageVersionMismatch:
      return "StorageVersionMismatch";
    case ErrorCode::kFeatureInvalidValue:
      return "FeatureInvalidValue";
    case ErrorCode::kTrackNotFound:
      return "TrackNotFound";
    case ErrorCode::kTrackInvalid:
      return "TrackInvalid";
    case ErrorCode::kEmptyPool:
      return "EmptyPool";
    case ErrorCode::kSeedExhausted:
      return "SeedExhausted";
    case ErrorCode::kNoMatch:
      return "NoMatch";
    case ErrorCode::kRunCapReached:
      return "RunCapReached";
    case ErrorCode::kExtractionUnavailable:
      return "ExtractionUnavailable";
    case ErrorCode::kExtractionRateLimited:
      return "ExtractionRateLimited";
    case ErrorCode::kExtractionInvalidResponse:
      return "ExtractionInvalidResponse";
    case ErrorCode::kGenreSourceFailed:
      return "GenreSourceFailed";
    case ErrorCode::kGenreSourceInvalidResponse:
      return "GenreSourceInvalidResponse";
    case ErrorCode::kProfileParseError:
      return "ProfileParseError";
    case ErrorCode::kPlaylistWriteError:
      return "PlaylistWriteError";
  }
  return "Unknown";
}

std::string Error::to_string() const {
  std::string result = "[";
  result += ErrorCodeToString(code_);
  result += "]";
  if (!message_.empty()) {
    result += " " + message_;
  }
  if (!context_.empty()) {
    result += " (" + context_ + ")";
  }
  return result;
}

}  // namespace tastemix::utils
