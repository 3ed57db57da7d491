#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace oreminer {
namespace common {

/**
 * @brief Logging levels for conditional output
 *
 * Controls logging verbosity. Rejected accounts are reported at WARN and round
 * progress at INFO; every decoded account is traced at TRACE.
 */
enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5 // Failures requiring operator attention (e.g. missing wallet)
};

/**
 * @brief Structured log entry for text and JSON output
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string module;
  std::string message;
  std::string error_code;
  std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Parse a level name (trace/debug/info/warn/error/critical)
 * @return the level, or nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(const std::string &name);

/**
 * @brief Global logging configuration
 *
 * Thread-safe logger writing one line per entry, either as human readable text
 * or as a JSON object. Callers check is_enabled() through the macros below so
 * that disabled levels cost no formatting.
 */
class Logger {
public:
  /// Get the singleton logger instance
  static Logger &instance() {
    static Logger logger;
    return logger;
  }

  /// Set current logging level
  void set_level(LogLevel level) noexcept {
    current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  /// Enable/disable structured JSON logging
  void set_json_format(bool enabled) noexcept {
    json_format_.store(enabled, std::memory_order_relaxed);
  }

  /// Redirect output (nullptr restores std::cout)
  void set_output(std::ostream *out) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ = out ? out : &std::cout;
  }

  /// Check if a specific level is enabled
  bool is_enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >=
           current_level_.load(std::memory_order_relaxed);
  }

  /// Log a message built from streamable arguments under a module tag
  template <typename... Args>
  void log(LogLevel level, const std::string &module, Args &&...args) {
    if (!is_enabled(level))
      return;

    std::ostringstream oss;
    (oss << ... << args);

    LogEntry entry{std::chrono::system_clock::now(), level, module, oss.str(),
                   "", {}};
    output_log_entry(entry);
  }

  /// Log a failure that needs operator attention; never filtered by level
  void log_critical_failure(
      const std::string &module, const std::string &message,
      const std::string &error_code = "",
      const std::unordered_map<std::string, std::string> &context = {}) {
    LogEntry entry{std::chrono::system_clock::now(), LogLevel::CRITICAL, module,
                   message, error_code, context};
    output_log_entry(entry);
  }

private:
  Logger()
      : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false),
        out_(&std::cout) {}

  std::atomic<int> current_level_;
  std::atomic<bool> json_format_;
  std::mutex output_mutex_;
  std::ostream *out_;

  void output_log_entry(const LogEntry &entry) {
    std::string line =
        json_format_.load() ? format_json(entry) : format_text(entry);
    std::lock_guard<std::mutex> lock(output_mutex_);
    (*out_) << line << std::endl;
  }

  static std::string format_json(const LogEntry &entry);
  static std::string format_text(const LogEntry &entry);
};

/// Upper-case level name as printed in log lines
const char *to_string(LogLevel level);

} // namespace common
} // namespace oreminer

/**
 * @brief Logging macros
 *
 * The first argument is the module tag, the rest are streamed into the message.
 * Levels below the current threshold skip formatting entirely.
 */
#define ORE_LOG_AT(lvl, ...)                                                   \
  do {                                                                         \
    if (oreminer::common::Logger::instance().is_enabled(lvl)) {                \
      oreminer::common::Logger::instance().log(lvl, __VA_ARGS__);              \
    }                                                                          \
  } while (0)

#define LOG_TRACE(...) ORE_LOG_AT(oreminer::common::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) ORE_LOG_AT(oreminer::common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...) ORE_LOG_AT(oreminer::common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) ORE_LOG_AT(oreminer::common::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) ORE_LOG_AT(oreminer::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...)                             \
  oreminer::common::Logger::instance().log_critical_failure(module, message,   \
                                                            ##__VA_ARGS__)

#define LOG_WALLET_ERROR(message, ...)                                         \
  LOG_CRITICAL_FAILURE("wallet", message, ##__VA_ARGS__)
