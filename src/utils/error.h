/**
 * @file error.h
 * @brief Error codes and error type used with Expected<T, Error>
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace vecscope::utils {

/**
 * @brief Error codes grouped by subsystem
 *
 * Ranges:
 * - 0-999: general
 * - 1000-1999: configuration
 * - 2000-2999: vector store extraction
 * - 3000-3999: network / HTTP facade
 */
enum class ErrorCode : std::uint16_t {
  kSuccess = 0,

  // General
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,
  kInternalError = 6,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigYamlError = 1001,
  kConfigParseError = 1002,
  kConfigValidationError = 1003,
  kConfigInvalidValue = 1004,

  // Vector store extraction
  kPathNotFound = 2000,           ///< Input path or required companion file missing
  kUnsupportedFormat = 2001,      ///< No detection rule matched
  kDependencyMissing = 2002,      ///< Required storage engine support unavailable
  kCorruptIndex = 2003,           ///< Store opened but unreadable or malformed
  kMetadataParseFailure = 2004,   ///< Sidecar or companion metadata undecodable
  kPartialReconstruction = 2005,  ///< Some vectors could not be reconstructed
  kNoCollections = 2006,          ///< Collection store holds no collection

  // Network / HTTP
  kNetworkAlreadyRunning = 3000,
  kNetworkBindFailed = 3001,
};

/**
 * @brief Get a stable name for an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kPathNotFound:
      return "PathNotFound";
    case ErrorCode::kUnsupportedFormat:
      return "UnsupportedFormat";
    case ErrorCode::kDependencyMissing:
      return "DependencyMissing";
    case ErrorCode::kCorruptIndex:
      return "CorruptIndex";
    case ErrorCode::kMetadataParseFailure:
      return "MetadataParseFailure";
    case ErrorCode::kPartialReconstruction:
      return "PartialReconstructionWarning";
    case ErrorCode::kNoCollections:
      return "NoCollections";
    case ErrorCode::kNetworkAlreadyRunning:
      return "NetworkAlreadyRunning";
    case ErrorCode::kNetworkBindFailed:
      return "NetworkBindFailed";
  }
  return "Unknown";
}

/**
 * @brief Error value carried by Expected<T, Error>
 *
 * Holds a machine-readable code, a human-readable message and an optional
 * context string (underlying library message, offending path, ...).
 */
class Error {
 public:
  Error() = default;
  Error(ErrorCode code, std::string message, std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Name] message (context)"
   */
  std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "] ";
    result += message_;
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an Error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace vecscope::utils
