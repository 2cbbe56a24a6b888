/**
 * @file version.h
 * @brief vecscope version information
 */

#pragma once

#include <string>

namespace vecscope {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.1.0")
   */
  static std::string String() { return "0.1.0"; }
};

}  // namespace vecscope
