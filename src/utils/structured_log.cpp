/**
 * @file structured_log.cpp
 * @brief Structured log rendering
 */

#include "utils/structured_log.h"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <sstream>
#include <string>

namespace tastemix::utils {

namespace {

/**
 * @brief Escape quotes, backslashes and control characters for text format
 */
std::string EscapeText(const std::string& str) {
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

std::string QuoteIfNeeded(const std::string& value) {
  if (value.find_first_of(" \"\n=") != std::string::npos || value.empty()) {
    return "\"" + EscapeText(value) + "\"";
  }
  return value;
}

}  // namespace

StructuredLog& StructuredLog::Field(const std::string& key, int64_t value) {
  fields_.push_back({key, std::to_string(value), FieldKind::kInteger});
  return *this;
}

StructuredLog& StructuredLog::Field(const std::string& key, uint64_t value) {
  fields_.push_back({key, std::to_string(value), FieldKind::kUnsigned});
  return *this;
}

StructuredLog& StructuredLog::Field(const std::string& key, double value) {
  std::ostringstream oss;
  oss << value;
  fields_.push_back({key, oss.str(), FieldKind::kReal, value});
  return *this;
}

StructuredLog& StructuredLog::Field(const std::string& key, bool value) {
  fields_.push_back({key, value ? "true" : "false", FieldKind::kBool});
  return *this;
}

std::string StructuredLog::Build() const {
  if (GetFormat() == LogFormat::TEXT) {
    return BuildText();
  }
  return BuildJSON();
}

std::string StructuredLog::BuildJSON() const {
  nlohmann::ordered_json line = nlohmann::ordered_json::object();
  if (!event_.empty()) {
    line["event"] = event_;
  }
  if (!message_.empty()) {
    line["message"] = message_;
  }
  for (const auto& field : fields_) {
    switch (field.kind) {
      case FieldKind::kString:
        line[field.key] = field.text;
        break;
      case FieldKind::kInteger:
        line[field.key] = std::stoll(field.text);
        break;
      case FieldKind::kUnsigned:
        line[field.key] = std::stoull(field.text);
        break;
      case FieldKind::kReal:
        line[field.key] = field.real;
        break;
      case FieldKind::kBool:
        line[field.key] = (field.text == "true");
        break;
    }
  }
  // Replace invalid UTF-8 instead of throwing from inside a log call
  return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string StructuredLog::BuildText() const {
  std::ostringstream text;
  bool first = true;
  auto separator = [&first, &text]() {
    if (!first) {
      text << " ";
    }
    first = false;
  };

  if (!event_.empty()) {
    separator();
    text << "event=" << QuoteIfNeeded(event_);
  }
  if (!message_.empty()) {
    separator();
    text << "message=\"" << EscapeText(message_) << "\"";
  }
  for (const auto& field : fields_) {
    separator();
    text << field.key << "=" << (field.kind == FieldKind::kString ? QuoteIfNeeded(field.text) : field.text);
  }
  return text.str();
}

Expected<void, Error> SetupLogging(const std::string& level, bool json, const std::string& file) {
  spdlog::drop("tastemix");
  try {
    std::shared_ptr<spdlog::logger> logger;
    if (file.empty()) {
      logger = spdlog::stderr_color_mt("tastemix");
    } else {
      logger = spdlog::basic_logger_mt("tastemix", file);
    }
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, std::string("Failed to open log sink: ") + e.what(),
                                    file));
  }
  spdlog::set_level(spdlog::level::from_str(level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  StructuredLog::SetFormat(json ? LogFormat::JSON : LogFormat::TEXT);
  return {};
}

}  // namespace tastemix::utils
