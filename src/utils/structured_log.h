/**
 * @file structured_log.h
 * @brief Structured logging on top of spdlog
 *
 * Every extraction step reports through StructuredLog so that store
 * detection, degradations and failures can be filtered by event name.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace vecscope::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log builder for JSON or text-formatted logs
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("store_warning")
 *   .Field("type", "sidecar_missing")
 *   .Field("path", index_path)
 *   .Field("records", count)
 *   .Warn();
 * @endcode
 *
 * Fields keep their type: numbers and booleans are emitted unquoted in JSON.
 * The format is process-wide, set once from logging.json.
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set global log format (JSON or TEXT)
   */
  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return Add(key, std::string(value)); }
  StructuredLog& Field(const std::string& key, const std::string& value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, std::string_view value) { return Add(key, std::string(value)); }
  StructuredLog& Field(const std::string& key, int64_t value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, uint64_t value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, double value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, bool value) { return Add(key, value); }

  /**
   * @brief Human-readable context, emitted right after the event name
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }

 private:
  using FieldList = std::vector<std::pair<std::string, nlohmann::json>>;

  std::string event_;
  std::string message_;
  FieldList fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};

  StructuredLog& Add(const std::string& key, nlohmann::json value) {
    fields_.emplace_back(key, std::move(value));
    return *this;
  }

  std::string Build() const {
    if (format_.load(std::memory_order_relaxed) == LogFormat::TEXT) {
      return BuildText();
    }
    return BuildJSON();
  }

  /**
   * @brief Build a single-line JSON object, keys in insertion order
   *
   * Invalid UTF-8 in paths or store content is replaced rather than thrown.
   */
  std::string BuildJSON() const {
    const auto dump = [](const nlohmann::json& value) {
      return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    };

    std::string out = "{";
    const auto append = [&out, &dump](const std::string& key, const nlohmann::json& value) {
      if (out.size() > 1) {
        out += ",";
      }
      out += dump(key) + ":" + dump(value);
    };

    if (!event_.empty()) {
      append("event", event_);
    }
    if (!message_.empty()) {
      append("message", message_);
    }
    for (const auto& field : fields_) {
      append(field.first, field.second);
    }
    out += "}";
    return out;
  }

  /**
   * @brief Build key=value pairs, quoting values that contain spaces or quotes
   */
  std::string BuildText() const {
    std::ostringstream text;
    bool first = true;
    const auto append = [&text, &first](const std::string& key, const std::string& value, bool force_quotes) {
      if (!first) {
        text << " ";
      }
      first = false;
      text << key << "=";
      if (force_quotes || value.find_first_of(" \"\n") != std::string::npos) {
        text << "\"" << EscapeText(value) << "\"";
      } else {
        text << value;
      }
    };

    if (!event_.empty()) {
      append("event", event_, false);
    }
    if (!message_.empty()) {
      append("message", message_, true);
    }
    for (const auto& field : fields_) {
      const nlohmann::json& value = field.second;
      append(field.first, value.is_string() ? value.get<std::string>() : value.dump(), false);
    }
    return text.str();
  }

  static std::string EscapeText(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      switch (chr) {
        case '"':
        case '\\':
          escaped += '\\';
          escaped += chr;
          break;
        case '\n':
          escaped += "\\n";
          break;
        case '\r':
          escaped += "\\r";
          break;
        case '\t':
          escaped += "\\t";
          break;
        default:
          escaped += chr;
      }
    }
    return escaped;
  }
};

/**
 * @brief Log a store-level failure that aborts an extraction
 */
inline void LogStoreError(const std::string& operation, const std::string& path, const std::string& error_msg) {
  StructuredLog()
      .Event("store_error")
      .Field("operation", operation)
      .Field("path", path)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a degradation that the extraction absorbs (empty metadata, zero vectors)
 */
inline void LogStoreWarning(const std::string& type, const std::string& path, const std::string& message) {
  StructuredLog().Event("store_warning").Field("type", type).Field("path", path).Message(message).Warn();
}

inline void LogStoreDetected(const std::string& path, const std::string& kind) {
  StructuredLog().Event("store_detected").Field("path", path).Field("kind", kind).Debug();
}

inline void LogExtractionComplete(const std::string& type, const std::string& path, size_t count, size_t dimension,
                                  size_t total, double latency_ms) {
  StructuredLog()
      .Event("extraction_complete")
      .Field("type", type)
      .Field("path", path)
      .Field("count", static_cast<uint64_t>(count))
      .Field("dimension", static_cast<uint64_t>(dimension))
      .Field("total_vectors", static_cast<uint64_t>(total))
      .Field("latency_ms", latency_ms)
      .Info();
}

}  // namespace vecscope::utils
