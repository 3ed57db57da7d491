#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <nlohmann/json.hpp>

namespace oreminer {
namespace common {

namespace {

// UTC with milliseconds, e.g. 2024-05-01T12:00:00.250Z
std::string iso8601_utc(std::chrono::system_clock::time_point timestamp) {
  auto seconds = std::chrono::system_clock::to_time_t(timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) %
            1000;
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);

  std::ostringstream out;
  out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << "."
      << std::setfill('0') << std::setw(3) << ms.count() << "Z";
  return out.str();
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "trace")
    return LogLevel::TRACE;
  if (lower == "debug")
    return LogLevel::DEBUG;
  if (lower == "info")
    return LogLevel::INFO;
  if (lower == "warn" || lower == "warning")
    return LogLevel::WARN;
  if (lower == "error")
    return LogLevel::ERROR;
  if (lower == "critical")
    return LogLevel::CRITICAL;
  return std::nullopt;
}

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string Logger::format_json(const LogEntry &entry) {
  nlohmann::json line = {{"timestamp", iso8601_utc(entry.timestamp)},
                         {"level", to_string(entry.level)},
                         {"module", entry.module},
                         {"message", entry.message}};
  if (!entry.error_code.empty()) {
    line["error_code"] = entry.error_code;
  }
  if (!entry.context.empty()) {
    line["context"] = entry.context;
  }
  // Messages may carry raw account bytes; never throw on invalid UTF-8
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(const LogEntry &entry) {
  std::ostringstream text;
  text << "[" << iso8601_utc(entry.timestamp) << "] [" << to_string(entry.level)
       << "] [" << entry.module << "] " << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  // Sorted so that lines are stable across runs
  std::map<std::string, std::string> context(entry.context.begin(),
                                             entry.context.end());
  const char *separator = " {";
  for (const auto &[key, value] : context) {
    text << separator << key << "=" << value;
    separator = ", ";
  }
  if (!context.empty()) {
    text << "}";
  }

  return text.str();
}

} // namespace common
} // namespace oreminer
