#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

namespace ledger {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Parses "debug", "INFO", "warn", ... Throws LedgerError(Configuration) on unknown names.
 */
LogLevel parseLogLevel(const std::string& name);
const char* logLevelName(LogLevel level);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; the correlation id carries the idempotency key of the transfer being logged.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const;

  // Set output stream (default: std::cout)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted when the builder is destroyed
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder(const LogBuilder&) = delete;
    LogBuilder& operator=(const LogBuilder&) = delete;

    LogBuilder& correlation(const std::string& correlation_id);
    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, std::uint64_t value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    nlohmann::json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  std::atomic<LogLevel> min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) ledger::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) ledger::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) ledger::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) ledger::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) ledger::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  ledger::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace ledger

#endif  // LOGGER_HPP_
