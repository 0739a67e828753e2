/**
 * @file logger.h
 * @brief Structured logging for doco services
 *
 * A Logger carries an application name and version, a minimum level, one formatter and one
 * or more outputs. Every entry may carry key/value fields, which the formatters render
 * either as `key=value` pairs (text) or as JSON members.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <source_location>

namespace doco::core {

/**
 * @brief Log level enumeration
 *
 * Ordered from most detailed (Trace) to most severe (Critical). Off disables output.
 */
enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Critical = 5,
  Off = 6,
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/**
 * @brief Borrowed key/value pair passed at a logging call site.
 *
 * Both strings only need to outlive the logging call.
 */
struct LogField {
  LogField(kj::StringPtr key, kj::StringPtr value) : key(key), value(value) {}

  kj::StringPtr key;
  kj::StringPtr value;
};

struct LogEntry {
  struct Field {
    kj::String key;
    kj::String value;
  };

  LogLevel level;
  kj::StringPtr logger;
  kj::StringPtr version;
  kj::String message;
  kj::Vector<Field> fields;
  kj::String file;
  int_least32_t line = 0;
  std::chrono::system_clock::time_point time_point;
};

/**
 * @brief Base class for log formatters
 */
class LogFormatter {
public:
  virtual ~LogFormatter() noexcept = default;

  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
  [[nodiscard]] virtual kj::StringPtr name() const = 0;
};

/**
 * @brief Human-readable formatter
 *
 * Format: [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] logger - message key=value ...
 */
class TextFormatter final : public LogFormatter {
public:
  explicit TextFormatter(bool use_color = false) : use_color_(use_color) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "TextFormatter"_kj;
  }

private:
  bool use_color_;

  [[nodiscard]] kj::String colorize(LogLevel level, kj::StringPtr text) const;
};

/**
 * @brief JSON-lines formatter
 *
 * One object per entry with `ts`, `level`, `logger`, `version`, `msg`, `caller`, followed by
 * the entry's fields as string members.
 */
class JsonFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "JsonFormatter"_kj;
  }
};

/**
 * @brief Base class for log output destinations
 */
class LogOutput {
public:
  virtual ~LogOutput() noexcept = default;

  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
};

/**
 * @brief Writes to stdout; Error and Critical go to stderr unless use_stderr is set, in which
 * case everything goes to stderr.
 */
class ConsoleOutput final : public LogOutput {
public:
  explicit ConsoleOutput(bool use_stderr = false) : use_stderr_(use_stderr) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;

private:
  bool use_stderr_;
};

class Logger final {
public:
  Logger(kj::StringPtr name, kj::StringPtr version,
         kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
         kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());

  ~Logger() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(Logger);

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;
  [[nodiscard]] bool enabled(LogLevel level) const;

  void set_formatter(kj::Own<LogFormatter> formatter);
  void add_output(kj::Own<LogOutput> output);

  [[nodiscard]] kj::StringPtr name() const {
    return name_;
  }
  [[nodiscard]] kj::StringPtr version() const {
    return version_;
  }

  void log(LogLevel level, kj::StringPtr message, std::initializer_list<LogField> fields = {},
           const std::source_location& location = std::source_location::current());

  void trace(kj::StringPtr message, std::initializer_list<LogField> fields = {},
             const std::source_location& location = std::source_location::current());
  void debug(kj::StringPtr message, std::initializer_list<LogField> fields = {},
             const std::source_location& location = std::source_location::current());
  void info(kj::StringPtr message, std::initializer_list<LogField> fields = {},
            const std::source_location& location = std::source_location::current());
  void warn(kj::StringPtr message, std::initializer_list<LogField> fields = {},
            const std::source_location& location = std::source_location::current());
  void error(kj::StringPtr message, std::initializer_list<LogField> fields = {},
             const std::source_location& location = std::source_location::current());
  void critical(kj::StringPtr message, std::initializer_list<LogField> fields = {},
                const std::source_location& location = std::source_location::current());

  void flush();

private:
  struct LoggerState {
    LogLevel level = LogLevel::Info;
    kj::Own<LogFormatter> formatter;
    kj::Vector<kj::Own<LogOutput>> outputs;
  };

  kj::String name_;
  kj::String version_;
  kj::MutexGuarded<LoggerState> guarded_;
};

/**
 * @brief Build the console logger used by doco processes.
 *
 * Debug mode logs at Debug level with colored text; otherwise Info level as JSON lines.
 */
[[nodiscard]] kj::Own<Logger> make_console_logger(kj::StringPtr name, kj::StringPtr version,
                                                  bool debug);

} // namespace doco::core
