/**
 * @file config.h
 * @brief Configuration structures and YAML parser for vecscope
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::config {

// Default values for configuration
namespace defaults {

// Extraction defaults
constexpr uint32_t kDefaultMaxRecords = 1000;
constexpr uint32_t kMaxRecordsLimit = 10000;

// Detection defaults
constexpr int kSearchDepth = 0;  // 0 = only the given path
constexpr int kMaxSearchDepth = 3;

// API defaults
constexpr int kHttpPort = 8000;
constexpr int kHttpReadTimeoutSec = 5;
constexpr int kHttpWriteTimeoutSec = 30;

}  // namespace defaults

/**
 * @brief Extraction limits
 */
struct ExtractionConfig {
  uint32_t default_max_records = defaults::kDefaultMaxRecords;  ///< max_records when a request omits it
  uint32_t max_records_limit = defaults::kMaxRecordsLimit;      ///< Largest max_records a request may ask for
};

/**
 * @brief Store detection configuration
 */
struct DetectionConfig {
  int search_depth = defaults::kSearchDepth;  ///< Subdirectory levels searched by auto-detection
};

/**
 * @brief API configuration
 */
struct ApiConfig {
  struct {
    std::string bind = "127.0.0.1";
    int port = defaults::kHttpPort;
    bool enable_cors = true;
    std::string cors_allow_origin = "*";
    int read_timeout_sec = defaults::kHttpReadTimeoutSec;
    int write_timeout_sec = defaults::kHttpWriteTimeoutSec;
  } http;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  ExtractionConfig extraction;  ///< Extraction limits
  DetectionConfig detection;    ///< Store detection
  ApiConfig api;                ///< API configuration
  LoggingConfig logging;        ///< Logging configuration
};

/**
 * @brief Load configuration from YAML file
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace vecscope::config
