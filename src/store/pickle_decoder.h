/**
 * @file pickle_decoder.h
 * @brief Decoder for Python pickle streams (protocols 2 to 5) into JSON values
 *
 * Only the data-carrying subset of the pickle machine is implemented; no
 * Python callable is ever invoked. Instances become JSON objects tagged with
 * their qualified class name.
 *
 * Value mapping:
 * - None/bool/int/float/str -> null/boolean/integer/float/string
 * - tuple/list/set/frozenset -> array
 * - dict -> object (keys stringified: 3 -> "3", None -> "None")
 * - bytes/bytearray -> binary
 * - class instance -> object with "__class__" plus its attributes
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace vecscope::store {

/// Attribute holding the qualified class name of a decoded instance
constexpr const char* kPickleClassKey = "__class__";

/// Attribute holding constructor arguments of an instance that has no state
constexpr const char* kPickleArgsKey = "__args__";

/**
 * @brief Single-use pickle machine
 *
 * Thread-safety: not thread-safe; create one decoder per stream.
 */
class PickleDecoder {
 public:
  explicit PickleDecoder(std::string data);

  /**
   * @brief Run the stream up to STOP
   * @return Decoded top-level value, kMetadataParseFailure on malformed or
   *         unsupported input
   */
  utils::Expected<nlohmann::json, utils::Error> Decode();

  /**
   * @brief Read and decode a whole file
   * @return kPathNotFound if the file is absent
   */
  static utils::Expected<nlohmann::json, utils::Error> DecodeFile(const std::string& path);

 private:
  using ValuePtr = std::shared_ptr<nlohmann::json>;

  utils::Expected<void, utils::Error> Step(uint8_t opcode);

  // Input
  bool Read(void* out, size_t count);
  bool ReadString(std::string& out, size_t count);
  bool ReadLine(std::string& out);
  template <typename T>
  bool ReadLittleEndian(T& value) {
    return Read(&value, sizeof(T));
  }

  // Stack
  void Push(nlohmann::json value);
  void PushShared(ValuePtr value);
  utils::Expected<ValuePtr, utils::Error> Pop();
  utils::Expected<ValuePtr, utils::Error> Top();
  utils::Expected<std::vector<ValuePtr>, utils::Error> PopMark();

  // Object construction
  utils::Expected<void, utils::Error> SetItems(std::vector<ValuePtr> items);
  nlohmann::json MakeGlobal(const std::string& module, const std::string& name) const;
  nlohmann::json Reduce(const nlohmann::json& callable, const nlohmann::json& args) const;
  nlohmann::json Instantiate(const nlohmann::json& cls, const nlohmann::json& args) const;
  static void Build(nlohmann::json& object, const nlohmann::json& state);

  static utils::Error Failure(const std::string& message);

  std::string data_;
  size_t pos_ = 0;
  std::vector<ValuePtr> stack_;
  std::vector<size_t> marks_;
  std::unordered_map<uint64_t, ValuePtr> memo_;
  bool stopped_ = false;
};

/**
 * @brief Dictionary key form of a decoded value ("3", "None", "True", ...)
 */
std::string PickleKeyString(const nlohmann::json& key);

/**
 * @brief Qualified class name of a decoded instance, empty for plain values
 */
std::string PickleClassName(const nlohmann::json& value);

}  // namespace vecscope::store
