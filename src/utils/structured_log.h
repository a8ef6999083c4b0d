/**
 * @file structured_log.h
 * @brief Structured logging utilities (JSON or key=value text)
 *
 * Provides helper functions for logging events in a structured format,
 * making it easier to parse logs programmatically for monitoring and analysis.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mongokit::utils {

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("mongo_connection_error")
 *   .Field("servers", config.servers)
 *   .Field("error", e.what())
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  /**
   * @brief Output format for structured events
   */
  enum class Format : uint8_t {
    kJson,  // {"event":"x","key":"value"}
    kText   // event=x key=value
  };

  StructuredLog() = default;

  /**
   * @brief Set process-wide output format
   */
  static void SetFormat(Format format) { FormatStorage().store(format); }

  static Format GetFormat() { return FormatStorage().load(); }

  /**
   * @brief Parse "json" / "text" (anything else is JSON)
   */
  static Format ParseFormat(const std::string& name) { return name == "text" ? Format::kText : Format::kJson; }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddQuoted(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddQuoted(key, value); }

  StructuredLog& Field(const std::string& key, std::string_view value) { return AddQuoted(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int value) { return Field(key, static_cast<int64_t>(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_.emplace_back(key, std::to_string(value), false);
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_.emplace_back(key, std::to_string(value), false);
    return *this;
  }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.emplace_back(key, oss.str(), false);
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_.emplace_back(key, value ? "true" : "false", false);  // No quotes for booleans
    return *this;
  }

  /**
   * @brief Add message field (optional, for human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render without logging
   */
  [[nodiscard]] std::string Build() const { return GetFormat() == Format::kText ? BuildText() : BuildJson(); }

 private:
  struct FieldEntry {
    FieldEntry(std::string key_in, std::string value_in, bool quoted_in)
        : key(std::move(key_in)), value(std::move(value_in)), quoted(quoted_in) {}

    std::string key;
    std::string value;
    bool quoted;
  };

  std::string event_;
  std::string message_;
  std::vector<FieldEntry> fields_;

  static std::atomic<Format>& FormatStorage() {
    static std::atomic<Format> format{Format::kJson};
    return format;
  }

  StructuredLog& AddQuoted(const std::string& key, const std::string& value) {
    fields_.emplace_back(key, value, true);
    return *this;
  }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";

    bool first = true;
    auto separator = [&]() {
      if (!first) {
        json << ",";
      }
      first = false;
    };

    if (!event_.empty()) {
      separator();
      json << R"("event":")" << EscapeJson(event_) << R"(")";
    }
    if (!message_.empty()) {
      separator();
      json << R"("message":")" << EscapeJson(message_) << R"(")";
    }
    for (const auto& field : fields_) {
      separator();
      json << "\"" << field.key << "\":";
      if (field.quoted) {
        json << "\"" << EscapeJson(field.value) << "\"";
      } else {
        json << field.value;
      }
    }

    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << "event=" << event_;
    if (!message_.empty()) {
      text << " message=\"" << message_ << "\"";
    }
    for (const auto& field : fields_) {
      text << " " << field.key << "=";
      // Quote values containing spaces so the line stays splittable
      if (field.quoted && field.value.find(' ') != std::string::npos) {
        text << "\"" << field.value << "\"";
      } else {
        text << field.value;
      }
    }
    return text.str();
  }

  static std::string EscapeJson(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log MongoDB connection error in structured format
 */
inline void LogMongoConnectionError(const std::string& servers, const std::string& database,
                                    const std::string& error_msg) {
  StructuredLog()
      .Event("mongo_connection_error")
      .Field("servers", servers)
      .Field("database", database)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log configuration load error in structured format
 */
inline void LogConfigLoadError(const std::string& path, const std::string& error_msg) {
  StructuredLog().Event("config_load_error").Field("path", path).Field("error", error_msg).Error();
}

}  // namespace mongokit::utils
