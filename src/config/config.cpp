/**
 * @file config.cpp
 * @brief Configuration parser implementation for vecscope
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace vecscope::config {

namespace {

constexpr int kMaxPort = 65535;

/**
 * @brief JSON value of a YAML scalar
 *
 * Quoted scalars (tag "!") stay strings, so `port: "8000"` reaches the
 * schema as a string and is rejected there instead of being coerced.
 */
json ScalarToJson(const YAML::Node& scalar) {
  if (scalar.Tag() == "!") {
    return scalar.Scalar();
  }

  int64_t integer = 0;
  if (YAML::convert<int64_t>::decode(scalar, integer)) {
    return integer;
  }
  double real = 0.0;
  if (YAML::convert<double>::decode(scalar, real)) {
    return real;
  }
  bool flag = false;
  if (YAML::convert<bool>::decode(scalar, flag)) {
    return flag;
  }
  return scalar.Scalar();
}

/**
 * @brief Build the document the schema validates from the YAML tree
 * @param pointer JSON pointer of node, reported when a mapping key is not a scalar
 */
utils::Expected<json, utils::Error> ToSchemaDocument(const YAML::Node& node, const std::string& pointer) {
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      return ScalarToJson(node);

    case YAML::NodeType::Sequence: {
      json items = json::array();
      size_t index = 0;
      for (const auto& item : node) {
        auto converted = ToSchemaDocument(item, pointer + "/" + std::to_string(index++));
        if (!converted) {
          return converted;
        }
        items.push_back(std::move(*converted));
      }
      return items;
    }

    case YAML::NodeType::Map: {
      json members = json::object();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigYamlError,
                                                        "Mapping keys must be scalars", pointer.empty() ? "/" : pointer));
        }
        const std::string key = entry.first.Scalar();
        auto converted = ToSchemaDocument(entry.second, pointer + "/" + key);
        if (!converted) {
          return converted;
        }
        members[key] = std::move(*converted);
      }
      return members;
    }

    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return json();
}

/**
 * @brief Copy an optional member of a validated section into a config field
 *
 * The schema has already checked types, so get<T>() cannot fail on type.
 */
template <typename T>
void Assign(const json& section, const char* key, T& field) {
  auto iter = section.find(key);
  if (iter != section.end() && !iter->is_null()) {
    field = iter->get<T>();
  }
}

/**
 * @brief Section object, or an empty object when absent or null
 */
const json& Section(const json& parent, const char* key) {
  static const json kEmpty = json::object();
  auto iter = parent.find(key);
  return (iter != parent.end() && iter->is_object()) ? *iter : kEmpty;
}

Config ParseConfig(const json& root) {
  Config config;

  const json& extraction = Section(root, "extraction");
  Assign(extraction, "default_max_records", config.extraction.default_max_records);
  Assign(extraction, "max_records_limit", config.extraction.max_records_limit);

  Assign(Section(root, "detection"), "search_depth", config.detection.search_depth);

  const json& http = Section(Section(root, "api"), "http");
  Assign(http, "bind", config.api.http.bind);
  Assign(http, "port", config.api.http.port);
  Assign(http, "enable_cors", config.api.http.enable_cors);
  Assign(http, "cors_allow_origin", config.api.http.cors_allow_origin);
  Assign(http, "read_timeout_sec", config.api.http.read_timeout_sec);
  Assign(http, "write_timeout_sec", config.api.http.write_timeout_sec);

  const json& logging = Section(root, "logging");
  Assign(logging, "level", config.logging.level);
  Assign(logging, "json", config.logging.json);
  Assign(logging, "file", config.logging.file);

  return config;
}

/**
 * @brief Validate configuration against the embedded JSON Schema
 *
 * Unknown keys, wrong types and out-of-range values are all rejected here,
 * before any field is copied into Config.
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const json& config_json) {
  json_validator validator;
  try {
    validator.set_root_schema(json::parse(kConfigSchemaJson));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("Embedded schema is invalid: ") + e.what()));
  }

  try {
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError,
                                                  std::string("Configuration validation failed: ") + e.what()));
  }

  utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    // An empty file yields a null node: every section keeps its defaults
    auto config_json = root.IsNull() ? utils::Expected<json, utils::Error>(json::object()) : ToSchemaDocument(root, "");
    if (!config_json) {
      return utils::MakeUnexpected(config_json.error());
    }

    auto validation_result = ValidateConfigSchema(*config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config = ParseConfig(*config_json);

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what()),
                         path));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what()), path));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what()), path));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate extraction configuration
  if (config.extraction.max_records_limit == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "extraction.max_records_limit must be greater than 0"));
  }
  if (config.extraction.default_max_records == 0 ||
      config.extraction.default_max_records > config.extraction.max_records_limit) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "extraction.default_max_records must be between 1 and extraction.max_records_limit (got: " +
            std::to_string(config.extraction.default_max_records) + ")"));
  }

  // Validate detection configuration
  if (config.detection.search_depth < 0 || config.detection.search_depth > defaults::kMaxSearchDepth) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "detection.search_depth must be between 0 and " + std::to_string(defaults::kMaxSearchDepth)));
  }

  // Validate API configuration
  if (config.api.http.port <= 0 || config.api.http.port > kMaxPort) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "api.http.port must be between 1 and 65535"));
  }
  if (config.api.http.read_timeout_sec <= 0 || config.api.http.write_timeout_sec <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "api.http timeouts must be greater than 0"));
  }
  if (config.api.http.enable_cors && config.api.http.cors_allow_origin.empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "api.http.cors_allow_origin must be set when CORS is enabled"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

}  // namespace vecscope::config
