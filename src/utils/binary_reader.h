/**
 * @file binary_reader.h
 * @brief Little-endian binary reads from a std::istream
 *
 * Used by the persisted HNSW segment parser. Values are read in host byte
 * order, which matches the little-endian files hnswlib writes on x86-64 and
 * ARM64.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <vector>

namespace vecscope::utils {

/**
 * @brief Read a trivially copyable value
 */
template <typename T>
bool ReadBinary(std::istream& input_stream, T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(&value), sizeof(T));
  return input_stream.good();
}

/**
 * @brief Read count float32 values
 */
inline bool ReadFloats(std::istream& input_stream, std::vector<float>& values, size_t count) {
  values.resize(count);
  if (count == 0) {
    return true;
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(values.data()), static_cast<std::streamsize>(count * sizeof(float)));
  return input_stream.good();
}

}  // namespace vecscope::utils
