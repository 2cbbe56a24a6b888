/**
 * @file pickle_decoder.cpp
 * @brief Pickle machine implementation
 */

#include "store/pickle_decoder.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace vecscope::store {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

// Marks a class reference pushed by GLOBAL / STACK_GLOBAL
constexpr const char* kGlobalKey = "__global__";

namespace op {
constexpr uint8_t kMark = '(';
constexpr uint8_t kStop = '.';
constexpr uint8_t kPop = '0';
constexpr uint8_t kPopMark = '1';
constexpr uint8_t kDup = '2';
constexpr uint8_t kFloat = 'F';
constexpr uint8_t kInt = 'I';
constexpr uint8_t kBinInt = 'J';
constexpr uint8_t kBinInt1 = 'K';
constexpr uint8_t kLong = 'L';
constexpr uint8_t kBinInt2 = 'M';
constexpr uint8_t kNone = 'N';
constexpr uint8_t kReduce = 'R';
constexpr uint8_t kBinString = 'T';
constexpr uint8_t kShortBinString = 'U';
constexpr uint8_t kBinUnicode = 'X';
constexpr uint8_t kAppend = 'a';
constexpr uint8_t kBuild = 'b';
constexpr uint8_t kGlobal = 'c';
constexpr uint8_t kDict = 'd';
constexpr uint8_t kEmptyDict = '}';
constexpr uint8_t kAppends = 'e';
constexpr uint8_t kGet = 'g';
constexpr uint8_t kBinGet = 'h';
constexpr uint8_t kLongBinGet = 'j';
constexpr uint8_t kList = 'l';
constexpr uint8_t kEmptyList = ']';
constexpr uint8_t kPut = 'p';
constexpr uint8_t kBinPut = 'q';
constexpr uint8_t kLongBinPut = 'r';
constexpr uint8_t kSetItem = 's';
constexpr uint8_t kTuple = 't';
constexpr uint8_t kEmptyTuple = ')';
constexpr uint8_t kSetItems = 'u';
constexpr uint8_t kBinFloat = 'G';
// Protocol 2
constexpr uint8_t kProto = 0x80;
constexpr uint8_t kNewObj = 0x81;
constexpr uint8_t kTuple1 = 0x85;
constexpr uint8_t kTuple2 = 0x86;
constexpr uint8_t kTuple3 = 0x87;
constexpr uint8_t kNewTrue = 0x88;
constexpr uint8_t kNewFalse = 0x89;
constexpr uint8_t kLong1 = 0x8a;
constexpr uint8_t kLong4 = 0x8b;
// Protocol 3
constexpr uint8_t kBinBytes = 'B';
constexpr uint8_t kShortBinBytes = 'C';
// Protocol 4
constexpr uint8_t kShortBinUnicode = 0x8c;
constexpr uint8_t kBinUnicode8 = 0x8d;
constexpr uint8_t kBinBytes8 = 0x8e;
constexpr uint8_t kEmptySet = 0x8f;
constexpr uint8_t kAddItems = 0x90;
constexpr uint8_t kFrozenSet = 0x91;
constexpr uint8_t kNewObjEx = 0x92;
constexpr uint8_t kStackGlobal = 0x93;
constexpr uint8_t kMemoize = 0x94;
constexpr uint8_t kFrame = 0x95;
// Protocol 5
constexpr uint8_t kByteArray8 = 0x96;
}  // namespace op

constexpr int kHighestProtocol = 5;
constexpr size_t kMaxIntegerBytes = 8;

bool IsGlobal(const json& value) {
  return value.is_object() && value.size() == 1 && value.contains(kGlobalKey);
}

std::string GlobalName(const json& value) {
  return IsGlobal(value) ? value[kGlobalKey].get<std::string>() : std::string();
}

/**
 * @brief Decode little-endian two's complement bytes (LONG1 / LONG4 payload)
 */
int64_t DecodeLong(const std::string& bytes) {
  if (bytes.empty()) {
    return 0;
  }
  uint64_t value = 0;
  for (size_t i = 0; i < bytes.size(); ++i) {
    value |= static_cast<uint64_t>(static_cast<uint8_t>(bytes[i])) << (8 * i);
  }
  // Sign-extend shorter encodings
  if (bytes.size() < kMaxIntegerBytes && (static_cast<uint8_t>(bytes.back()) & 0x80U) != 0) {
    value |= ~uint64_t{0} << (8 * bytes.size());
  }
  return static_cast<int64_t>(value);
}

json ToBinary(const std::string& bytes) {
  return json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

/**
 * @brief Encode a UTF-8 string as latin-1 bytes (code points above 0xFF are dropped)
 *
 * Protocol 2 stores bytes objects as _codecs.encode(str, "latin1").
 */
std::string Utf8ToLatin1(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size();) {
    auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80U) {
      out.push_back(static_cast<char>(lead));
      i += 1;
    } else if ((lead & 0xE0U) == 0xC0U && i + 1 < text.size()) {
      uint32_t code = ((lead & 0x1FU) << 6) | (static_cast<uint8_t>(text[i + 1]) & 0x3FU);
      if (code <= 0xFFU) {
        out.push_back(static_cast<char>(code));
      }
      i += 2;
    } else if ((lead & 0xF0U) == 0xE0U) {
      i += 3;
    } else {
      i += 4;
    }
  }
  return out;
}

}  // namespace

PickleDecoder::PickleDecoder(std::string data) : data_(std::move(data)) {}

utils::Error PickleDecoder::Failure(const std::string& message) {
  return MakeError(ErrorCode::kMetadataParseFailure, "Failed to decode pickle: " + message);
}

utils::Expected<json, utils::Error> PickleDecoder::DecodeFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kPathNotFound, "File not found: " + path));
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return MakeUnexpected(MakeError(ErrorCode::kMetadataParseFailure, "Cannot open pickle file", path));
  }
  std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

  PickleDecoder decoder(std::move(data));
  auto result = decoder.Decode();
  if (!result) {
    return MakeUnexpected(MakeError(result.error().code(), result.error().message(), path));
  }
  return result;
}

utils::Expected<json, utils::Error> PickleDecoder::Decode() {
  while (!stopped_) {
    uint8_t opcode = 0;
    if (!Read(&opcode, 1)) {
      return MakeUnexpected(Failure("unexpected end of stream"));
    }
    auto step = Step(opcode);
    if (!step) {
      return MakeUnexpected(step.error());
    }
  }

  auto result = Pop();
  if (!result) {
    return MakeUnexpected(result.error());
  }
  return **result;
}

bool PickleDecoder::Read(void* out, size_t count) {
  if (count > data_.size() - pos_) {
    return false;
  }
  std::memcpy(out, data_.data() + pos_, count);
  pos_ += count;
  return true;
}

bool PickleDecoder::ReadString(std::string& out, size_t count) {
  if (count > data_.size() - pos_) {
    return false;
  }
  out.assign(data_, pos_, count);
  pos_ += count;
  return true;
}

bool PickleDecoder::ReadLine(std::string& out) {
  size_t end = data_.find('\n', pos_);
  if (end == std::string::npos) {
    return false;
  }
  out.assign(data_, pos_, end - pos_);
  pos_ = end + 1;
  return true;
}

void PickleDecoder::Push(json value) {
  stack_.push_back(std::make_shared<json>(std::move(value)));
}

void PickleDecoder::PushShared(ValuePtr value) {
  stack_.push_back(std::move(value));
}

utils::Expected<PickleDecoder::ValuePtr, utils::Error> PickleDecoder::Pop() {
  size_t floor = marks_.empty() ? 0 : marks_.back();
  if (stack_.size() <= floor) {
    return MakeUnexpected(Failure("stack underflow"));
  }
  ValuePtr value = std::move(stack_.back());
  stack_.pop_back();
  return value;
}

utils::Expected<PickleDecoder::ValuePtr, utils::Error> PickleDecoder::Top() {
  size_t floor = marks_.empty() ? 0 : marks_.back();
  if (stack_.size() <= floor) {
    return MakeUnexpected(Failure("stack underflow"));
  }
  return stack_.back();
}

utils::Expected<std::vector<PickleDecoder::ValuePtr>, utils::Error> PickleDecoder::PopMark() {
  if (marks_.empty()) {
    return MakeUnexpected(Failure("mark not found"));
  }
  size_t mark = marks_.back();
  marks_.pop_back();

  std::vector<ValuePtr> items(std::make_move_iterator(stack_.begin() + static_cast<std::ptrdiff_t>(mark)),
                              std::make_move_iterator(stack_.end()));
  stack_.resize(mark);
  return items;
}

json PickleDecoder::MakeGlobal(const std::string& module, const std::string& name) const {
  // Python 2 module names appear in protocol 2 streams
  std::string qualified_module = module == "__builtin__" ? "builtins" : module;
  if (qualified_module == "copy_reg") {
    qualified_module = "copyreg";
  }
  return json{{kGlobalKey, qualified_module + "." + name}};
}

json PickleDecoder::Instantiate(const json& cls, const json& args) const {
  json object = json::object();
  object[kPickleClassKey] = IsGlobal(cls) ? GlobalName(cls) : std::string("unknown");
  if (args.is_array() && !args.empty()) {
    object[kPickleArgsKey] = args;
  }
  return object;
}

json PickleDecoder::Reduce(const json& callable, const json& args) const {
  const std::string name = GlobalName(callable);
  const bool has_args = args.is_array() && !args.empty();

  if (name == "collections.OrderedDict" || name == "builtins.dict") {
    json mapping = json::object();
    if (has_args && args[0].is_array()) {
      for (const auto& pair : args[0]) {
        if (pair.is_array() && pair.size() == 2) {
          mapping[PickleKeyString(pair[0])] = pair[1];
        }
      }
    }
    return mapping;
  }
  if (name == "builtins.set" || name == "builtins.frozenset" || name == "builtins.list" ||
      name == "builtins.tuple") {
    return has_args && args[0].is_array() ? args[0] : json::array();
  }
  if (name == "_codecs.encode" && has_args && args[0].is_string()) {
    return ToBinary(Utf8ToLatin1(args[0].get<std::string>()));
  }
  if (name == "builtins.bytearray" || name == "builtins.bytes") {
    if (has_args && args[0].is_binary()) {
      return args[0];
    }
    return ToBinary(std::string());
  }
  if (name == "copyreg._reconstructor" && has_args) {
    return Instantiate(args[0], json::array());
  }
  if (name == "copyreg.__newobj__" && has_args) {
    json rest = json::array();
    for (size_t i = 1; i < args.size(); ++i) {
      rest.push_back(args[i]);
    }
    return Instantiate(args[0], rest);
  }
  return Instantiate(callable, args);
}

void PickleDecoder::Build(json& object, const json& state) {
  auto merge = [&object](const json& attributes) {
    if (!attributes.is_object()) {
      return;
    }
    for (auto iter = attributes.begin(); iter != attributes.end(); ++iter) {
      object[iter.key()] = iter.value();
    }
  };

  if (!object.is_object()) {
    return;
  }

  if (state.is_object()) {
    // pydantic models pickle their fields under "__dict__"
    auto dict = state.find("__dict__");
    if (dict != state.end() && dict->is_object()) {
      merge(*dict);
    } else {
      merge(state);
    }
  } else if (state.is_array() && state.size() == 2) {
    // (instance dict, slots dict)
    merge(state[0]);
    merge(state[1]);
  } else if (!state.is_null()) {
    object["__state__"] = state;
  }
}

utils::Expected<void, utils::Error> PickleDecoder::SetItems(std::vector<ValuePtr> items) {
  if (items.size() % 2 != 0) {
    return MakeUnexpected(Failure("odd number of items for SETITEMS"));
  }
  auto target = Top();
  if (!target) {
    return MakeUnexpected(target.error());
  }
  json& mapping = **target;
  if (!mapping.is_object()) {
    return MakeUnexpected(Failure("SETITEMS on a non-dict value"));
  }
  for (size_t i = 0; i < items.size(); i += 2) {
    mapping[PickleKeyString(*items[i])] = *items[i + 1];
  }
  return {};
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
utils::Expected<void, utils::Error> PickleDecoder::Step(uint8_t opcode) {
  switch (opcode) {
    case op::kProto: {
      uint8_t protocol = 0;
      if (!Read(&protocol, 1)) {
        return MakeUnexpected(Failure("truncated PROTO"));
      }
      if (protocol > kHighestProtocol) {
        return MakeUnexpected(Failure("unsupported protocol " + std::to_string(protocol)));
      }
      return {};
    }
    case op::kFrame: {
      uint64_t frame_size = 0;
      if (!ReadLittleEndian(frame_size)) {
        return MakeUnexpected(Failure("truncated FRAME"));
      }
      return {};
    }
    case op::kStop:
      stopped_ = true;
      return {};

    case op::kMark:
      marks_.push_back(stack_.size());
      return {};

    case op::kPop: {
      if (!marks_.empty() && stack_.size() == marks_.back()) {
        marks_.pop_back();
        return {};
      }
      auto popped = Pop();
      if (!popped) {
        return MakeUnexpected(popped.error());
      }
      return {};
    }
    case op::kPopMark: {
      auto popped = PopMark();
      if (!popped) {
        return MakeUnexpected(popped.error());
      }
      return {};
    }
    case op::kDup: {
      auto top = Top();
      if (!top) {
        return MakeUnexpected(top.error());
      }
      Push(**top);
      return {};
    }

    // Scalars
    case op::kNone:
      Push(nullptr);
      return {};
    case op::kNewTrue:
      Push(true);
      return {};
    case op::kNewFalse:
      Push(false);
      return {};
    case op::kBinInt: {
      int32_t value = 0;
      if (!ReadLittleEndian(value)) {
        return MakeUnexpected(Failure("truncated BININT"));
      }
      Push(value);
      return {};
    }
    case op::kBinInt1: {
      uint8_t value = 0;
      if (!ReadLittleEndian(value)) {
        return MakeUnexpected(Failure("truncated BININT1"));
      }
      Push(value);
      return {};
    }
    case op::kBinInt2: {
      uint16_t value = 0;
      if (!ReadLittleEndian(value)) {
        return MakeUnexpected(Failure("truncated BININT2"));
      }
      Push(value);
      return {};
    }
    case op::kLong1:
    case op::kLong4: {
      uint32_t length = 0;
      if (opcode == op::kLong1) {
        uint8_t short_length = 0;
        if (!ReadLittleEndian(short_length)) {
          return MakeUnexpected(Failure("truncated LONG1"));
        }
        length = short_length;
      } else if (!ReadLittleEndian(length)) {
        return MakeUnexpected(Failure("truncated LONG4"));
      }
      std::string bytes;
      if (!ReadString(bytes, length)) {
        return MakeUnexpected(Failure("truncated long integer"));
      }
      if (bytes.size() > kMaxIntegerBytes) {
        // Unsigned values up to 2^64 - 1 carry one extra zero byte
        if (bytes.size() == kMaxIntegerBytes + 1 && bytes.back() == 0) {
          bytes.pop_back();
          uint64_t value = 0;
          std::memcpy(&value, bytes.data(), sizeof(value));
          Push(value);
          return {};
        }
        return MakeUnexpected(Failure("integer wider than 64 bits"));
      }
      Push(DecodeLong(bytes));
      return {};
    }
    case op::kInt:
    case op::kLong: {
      std::string line;
      if (!ReadLine(line)) {
        return MakeUnexpected(Failure("truncated INT"));
      }
      if (opcode == op::kInt && line == "01") {
        Push(true);
        return {};
      }
      if (opcode == op::kInt && line == "00") {
        Push(false);
        return {};
      }
      if (!line.empty() && line.back() == 'L') {
        line.pop_back();
      }
      try {
        Push(static_cast<int64_t>(std::stoll(line)));
      } catch (const std::exception&) {
        return MakeUnexpected(Failure("invalid integer literal '" + line + "'"));
      }
      return {};
    }
    case op::kBinFloat: {
      // Big-endian IEEE 754 double
      uint8_t bytes[sizeof(double)];
      if (!Read(bytes, sizeof(bytes))) {
        return MakeUnexpected(Failure("truncated BINFLOAT"));
      }
      uint64_t bits = 0;
      for (uint8_t byte : bytes) {
        bits = (bits << 8) | byte;
      }
      double value = 0.0;
      std::memcpy(&value, &bits, sizeof(value));
      Push(value);
      return {};
    }
    case op::kFloat: {
      std::string line;
      if (!ReadLine(line)) {
        return MakeUnexpected(Failure("truncated FLOAT"));
      }
      try {
        Push(std::stod(line));
      } catch (const std::exception&) {
        return MakeUnexpected(Failure("invalid float literal '" + line + "'"));
      }
      return {};
    }

    // Strings and bytes
    case op::kShortBinUnicode:
    case op::kShortBinString:
    case op::kShortBinBytes: {
      uint8_t length = 0;
      std::string text;
      if (!ReadLittleEndian(length) || !ReadString(text, length)) {
        return MakeUnexpected(Failure("truncated short string"));
      }
      if (opcode == op::kShortBinBytes) {
        Push(ToBinary(text));
      } else {
        Push(std::move(text));
      }
      return {};
    }
    case op::kBinUnicode:
    case op::kBinString:
    case op::kBinBytes: {
      uint32_t length = 0;
      std::string text;
      if (!ReadLittleEndian(length) || !ReadString(text, length)) {
        return MakeUnexpected(Failure("truncated string"));
      }
      if (opcode == op::kBinBytes) {
        Push(ToBinary(text));
      } else {
        Push(std::move(text));
      }
      return {};
    }
    case op::kBinUnicode8:
    case op::kBinBytes8:
    case op::kByteArray8: {
      uint64_t length = 0;
      std::string text;
      if (!ReadLittleEndian(length) || !ReadString(text, static_cast<size_t>(length))) {
        return MakeUnexpected(Failure("truncated string"));
      }
      if (opcode == op::kBinUnicode8) {
        Push(std::move(text));
      } else {
        Push(ToBinary(text));
      }
      return {};
    }

    // Containers
    case op::kEmptyDict:
      Push(json::object());
      return {};
    case op::kEmptyList:
    case op::kEmptyTuple:
    case op::kEmptySet:
      Push(json::array());
      return {};

    case op::kTuple:
    case op::kList:
    case op::kFrozenSet: {
      auto items = PopMark();
      if (!items) {
        return MakeUnexpected(items.error());
      }
      json array = json::array();
      for (const auto& item : *items) {
        array.push_back(*item);
      }
      Push(std::move(array));
      return {};
    }
    case op::kTuple1:
    case op::kTuple2:
    case op::kTuple3: {
      size_t size = static_cast<size_t>(opcode - op::kTuple1) + 1;
      std::vector<ValuePtr> items(size);
      for (size_t i = size; i > 0; --i) {
        auto item = Pop();
        if (!item) {
          return MakeUnexpected(item.error());
        }
        items[i - 1] = std::move(*item);
      }
      json array = json::array();
      for (const auto& item : items) {
        array.push_back(*item);
      }
      Push(std::move(array));
      return {};
    }
    case op::kDict: {
      auto items = PopMark();
      if (!items) {
        return MakeUnexpected(items.error());
      }
      Push(json::object());
      return SetItems(std::move(*items));
    }
    case op::kSetItem: {
      auto value = Pop();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto key = Pop();
      if (!key) {
        return MakeUnexpected(key.error());
      }
      return SetItems({std::move(*key), std::move(*value)});
    }
    case op::kSetItems: {
      auto items = PopMark();
      if (!items) {
        return MakeUnexpected(items.error());
      }
      return SetItems(std::move(*items));
    }
    case op::kAppend:
    case op::kAppends:
    case op::kAddItems: {
      std::vector<ValuePtr> items;
      if (opcode == op::kAppend) {
        auto value = Pop();
        if (!value) {
          return MakeUnexpected(value.error());
        }
        items.push_back(std::move(*value));
      } else {
        auto marked = PopMark();
        if (!marked) {
          return MakeUnexpected(marked.error());
        }
        items = std::move(*marked);
      }
      auto target = Top();
      if (!target) {
        return MakeUnexpected(target.error());
      }
      json& array = **target;
      if (!array.is_array()) {
        return MakeUnexpected(Failure("APPEND on a non-list value"));
      }
      for (const auto& item : items) {
        array.push_back(*item);
      }
      return {};
    }

    // Memo
    case op::kMemoize: {
      auto top = Top();
      if (!top) {
        return MakeUnexpected(top.error());
      }
      const uint64_t index = memo_.size();
      memo_[index] = *top;
      return {};
    }
    case op::kBinPut:
    case op::kLongBinPut:
    case op::kPut: {
      uint64_t index = 0;
      if (opcode == op::kBinPut) {
        uint8_t short_index = 0;
        if (!ReadLittleEndian(short_index)) {
          return MakeUnexpected(Failure("truncated BINPUT"));
        }
        index = short_index;
      } else if (opcode == op::kLongBinPut) {
        uint32_t long_index = 0;
        if (!ReadLittleEndian(long_index)) {
          return MakeUnexpected(Failure("truncated LONG_BINPUT"));
        }
        index = long_index;
      } else {
        std::string line;
        if (!ReadLine(line)) {
          return MakeUnexpected(Failure("truncated PUT"));
        }
        try {
          index = std::stoull(line);
        } catch (const std::exception&) {
          return MakeUnexpected(Failure("invalid PUT index"));
        }
      }
      auto top = Top();
      if (!top) {
        return MakeUnexpected(top.error());
      }
      memo_[index] = *top;
      return {};
    }
    case op::kBinGet:
    case op::kLongBinGet:
    case op::kGet: {
      uint64_t index = 0;
      if (opcode == op::kBinGet) {
        uint8_t short_index = 0;
        if (!ReadLittleEndian(short_index)) {
          return MakeUnexpected(Failure("truncated BINGET"));
        }
        index = short_index;
      } else if (opcode == op::kLongBinGet) {
        uint32_t long_index = 0;
        if (!ReadLittleEndian(long_index)) {
          return MakeUnexpected(Failure("truncated LONG_BINGET"));
        }
        index = long_index;
      } else {
        std::string line;
        if (!ReadLine(line)) {
          return MakeUnexpected(Failure("truncated GET"));
        }
        try {
          index = std::stoull(line);
        } catch (const std::exception&) {
          return MakeUnexpected(Failure("invalid GET index"));
        }
      }
      auto iter = memo_.find(index);
      if (iter == memo_.end()) {
        return MakeUnexpected(Failure("memo key " + std::to_string(index) + " not found"));
      }
      PushShared(iter->second);
      return {};
    }

    // Classes and instances
    case op::kGlobal: {
      std::string module;
      std::string name;
      if (!ReadLine(module) || !ReadLine(name)) {
        return MakeUnexpected(Failure("truncated GLOBAL"));
      }
      Push(MakeGlobal(module, name));
      return {};
    }
    case op::kStackGlobal: {
      auto name = Pop();
      if (!name) {
        return MakeUnexpected(name.error());
      }
      auto module = Pop();
      if (!module) {
        return MakeUnexpected(module.error());
      }
      if (!(*module)->is_string() || !(*name)->is_string()) {
        return MakeUnexpected(Failure("STACK_GLOBAL requires strings"));
      }
      Push(MakeGlobal((*module)->get<std::string>(), (*name)->get<std::string>()));
      return {};
    }
    case op::kReduce: {
      auto args = Pop();
      if (!args) {
        return MakeUnexpected(args.error());
      }
      auto callable = Pop();
      if (!callable) {
        return MakeUnexpected(callable.error());
      }
      Push(Reduce(**callable, **args));
      return {};
    }
    case op::kNewObj: {
      auto args = Pop();
      if (!args) {
        return MakeUnexpected(args.error());
      }
      auto cls = Pop();
      if (!cls) {
        return MakeUnexpected(cls.error());
      }
      Push(Instantiate(**cls, **args));
      return {};
    }
    case op::kNewObjEx: {
      auto kwargs = Pop();
      if (!kwargs) {
        return MakeUnexpected(kwargs.error());
      }
      auto args = Pop();
      if (!args) {
        return MakeUnexpected(args.error());
      }
      auto cls = Pop();
      if (!cls) {
        return MakeUnexpected(cls.error());
      }
      json object = Instantiate(**cls, **args);
      Build(object, **kwargs);
      Push(std::move(object));
      return {};
    }
    case op::kBuild: {
      auto state = Pop();
      if (!state) {
        return MakeUnexpected(state.error());
      }
      auto target = Top();
      if (!target) {
        return MakeUnexpected(target.error());
      }
      Build(**target, **state);
      return {};
    }

    default: {
      std::ostringstream oss;
      oss << "unsupported opcode 0x" << std::hex << static_cast<int>(opcode) << " at offset " << std::dec
          << (pos_ - 1);
      return MakeUnexpected(Failure(oss.str()));
    }
  }
}

std::string PickleKeyString(const json& key) {
  if (key.is_string()) {
    return key.get<std::string>();
  }
  if (key.is_null()) {
    return "None";
  }
  if (key.is_boolean()) {
    return key.get<bool>() ? "True" : "False";
  }
  if (key.is_binary()) {
    const auto& bytes = key.get_binary();
    return std::string(bytes.begin(), bytes.end());
  }
  return key.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string PickleClassName(const json& value) {
  if (!value.is_object()) {
    return {};
  }
  auto iter = value.find(kPickleClassKey);
  if (iter == value.end() || !iter->is_string()) {
    return {};
  }
  return iter->get<std::string>();
}

}  // namespace vecscope::store
