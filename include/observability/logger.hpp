#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace payrecon {
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

std::optional<LogLevel> logLevelFromString(const std::string& value);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; entries carry a component and an optional correlation id
 * (statement id or wire reference) so a batch can be traced end to end.
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

  // Default: std::cerr, so stdout stays free for reports
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

  // Entry with key-value fields, written when the builder goes out of scope
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, long long value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);
    LogBuilder& correlation(const std::string& correlation_id);

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

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

#define LOG_DEBUG(msg) payrecon::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) payrecon::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) payrecon::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) payrecon::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) payrecon::observability::Logger::getInstance().fatal(msg, __func__)

#define LOG_BUILDER(level, msg) \
  payrecon::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace payrecon

#endif  // LOGGER_HPP_
