/**
 * @file source_keys.cpp
 * @brief Source key resolution
 */

#include "store/source_keys.h"

namespace vecscope::store {

std::string ScalarToString(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number() || value.is_boolean()) {
    return value.dump();
  }
  return {};
}

std::string ResolveSource(const nlohmann::json& metadata) {
  if (!metadata.is_object()) {
    return {};
  }
  for (const char* key : kSourceKeys) {
    auto iter = metadata.find(key);
    if (iter != metadata.end()) {
      return ScalarToString(*iter);
    }
  }
  return {};
}

}  // namespace vecscope::store
