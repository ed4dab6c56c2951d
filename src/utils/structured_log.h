/**
 * @file structured_log.h
 * @brief Structured logging on top of spdlog (JSON or key=value text)
 *
 * Every operational event is logged as one line carrying an event name and
 * typed fields, so runs can be inspected with jq or grep alike.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("seed_attempt_failed")
 *   .Field("artist", artist)
 *   .Field("attempt", static_cast<int64_t>(attempt))
 *   .Warn();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set global log format (thread-safe)
   */
  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Parse "json" or "text" (anything else yields JSON)
   */
  static LogFormat ParseFormat(const std::string& format_str) {
    return format_str == "text" ? LogFormat::TEXT : LogFormat::JSON;
  }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, std::string(value)); }
  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }
  StructuredLog& Field(const std::string& key, std::string_view value) { return AddString(key, std::string(value)); }
  StructuredLog& Field(const std::string& key, int64_t value);
  StructuredLog& Field(const std::string& key, uint64_t value);
  StructuredLog& Field(const std::string& key, double value);
  StructuredLog& Field(const std::string& key, bool value);

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the line in the current global format
   */
  std::string Build() const;

 private:
  enum class FieldKind : std::uint8_t { kString, kInteger, kUnsigned, kReal, kBool };

  struct LogField {
    std::string key;
    std::string text;   // Rendered scalar value
    FieldKind kind;
    double real = 0.0;  // Exact value for kReal
  };

  StructuredLog& AddString(const std::string& key, std::string value) {
    fields_.push_back({key, std::move(value), FieldKind::kString});
    return *this;
  }

  std::string BuildJSON() const;
  std::string BuildText() const;

  std::string event_;
  std::string message_;
  std::vector<LogField> fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};
};

/**
 * @brief Install the "tastemix" default logger
 *
 * Logs go to file when it is set, otherwise to stderr. stdout is left to
 * command output such as the playlist JSON.
 *
 * @param level spdlog level name ("info", "debug", ...)
 * @param json Structured lines as JSON (otherwise key=value text)
 * @param file Log file path, empty for stderr
 */
Expected<void, Error> SetupLogging(const std::string& level, bool json, const std::string& file);

/**
 * @brief Log a feature store / genre cache error
 */
inline void LogStoreError(const std::string& operation, const std::string& key, const std::string& error_msg) {
  StructuredLog().Event("store_error").Field("operation", operation).Field("key", key).Field("error", error_msg).Error();
}

/**
 * @brief Log a snapshot I/O error
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

inline void LogStorageInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_info").Field("operation", operation).Field("message", message).Info();
}

inline void LogStorageWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_warning").Field("operation", operation).Field("message", message).Warn();
}

/**
 * @brief Log a failed call to one genre source
 */
inline void LogGenreSourceFailure(const std::string& source, const std::string& artist, const std::string& error_msg) {
  StructuredLog()
      .Event("genre_source_failed")
      .Field("source", source)
      .Field("artist", artist)
      .Field("error", error_msg)
      .Warn();
}

/**
 * @brief Log a failed extraction attempt for a seed track
 */
inline void LogExtractionFailure(const std::string& artist, const std::string& track_id, int attempt,
                                 const std::string& error_msg) {
  StructuredLog()
      .Event("extraction_failed")
      .Field("artist", artist)
      .Field("track_id", track_id)
      .Field("attempt", static_cast<int64_t>(attempt))
      .Field("error", error_msg)
      .Warn();
}

/**
 * @brief Log the outcome of one similarity match
 */
inline void LogMatchOutcome(const std::string& seed_artist, const std::string& phase, const std::string& track_id,
                            int examined, double latency_us) {
  StructuredLog()
      .Event("similarity_match")
      .Field("seed_artist", seed_artist)
      .Field("phase", phase)
      .Field("track_id", track_id)
      .Field("examined", static_cast<int64_t>(examined))
      .Field("latency_us", latency_us)
      .Info();
}

}  // namespace tastemix::utils
