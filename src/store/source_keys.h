/**
 * @file source_keys.h
 * @brief Best-effort source extraction from per-record metadata
 */

#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <string>

namespace vecscope::store {

/// Metadata keys consulted for a record's source, first present key wins
constexpr std::array<const char*, 4> kSourceKeys = {"source", "file", "path", "filename"};

/**
 * @brief Resolve the source of a record from its metadata mapping
 * @return Value of the first present key in kSourceKeys, empty if none
 */
std::string ResolveSource(const nlohmann::json& metadata);

/**
 * @brief Render a scalar JSON value as text
 *
 * Strings are returned as-is, numbers and booleans in JSON form; null,
 * arrays and objects yield an empty string.
 */
std::string ScalarToString(const nlohmann::json& value);

}  // namespace vecscope::store
