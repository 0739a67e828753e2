#include "doco/core/logger.h"

#include "doco/core/json.h"

#include <cstdio>
#include <ctime>
#include <kj/debug.h>
#include <kj/string-tree.h>

namespace doco::core {

kj::StringPtr to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE"_kj;
  case LogLevel::Debug:
    return "DEBUG"_kj;
  case LogLevel::Info:
    return "INFO"_kj;
  case LogLevel::Warn:
    return "WARN"_kj;
  case LogLevel::Error:
    return "ERROR"_kj;
  case LogLevel::Critical:
    return "CRITICAL"_kj;
  case LogLevel::Off:
    return "OFF"_kj;
  }
  return "UNKNOWN"_kj;
}

namespace {

kj::StringPtr basename_of(kj::StringPtr path) {
  KJ_IF_SOME(slash, path.findLast('/')) {
    return path.slice(slash + 1);
  }
  return path;
}

kj::String format_timestamp(std::chrono::system_clock::time_point tp, bool utc) {
  auto time_t_sec = std::chrono::system_clock::to_time_t(tp);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm{};
  if (utc) {
    gmtime_r(&time_t_sec, &tm);
  } else {
    localtime_r(&time_t_sec, &tm);
  }

  char buf[64];
  std::snprintf(buf, sizeof(buf), utc ? "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ"
                                      : "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms.count()));
  return kj::str(buf);
}

// Values with spaces or quotes are quoted so that key=value pairs stay splittable.
kj::String quote_if_needed(kj::StringPtr value) {
  bool needs_quotes = value.size() == 0;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t') {
      needs_quotes = true;
      break;
    }
  }
  if (!needs_quotes) {
    return kj::str(value);
  }

  kj::Vector<char> out(value.size() + 2);
  out.add('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.add('\\');
    }
    out.add(c);
  }
  out.add('"');
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

} // namespace

// ============================================================================
// TextFormatter
// ============================================================================

kj::String TextFormatter::colorize(LogLevel level, kj::StringPtr text) const {
  if (!use_color_) {
    return kj::str(text);
  }

  kj::StringPtr color_code = "\033[0m"_kj;
  switch (level) {
  case LogLevel::Trace:
    color_code = "\033[90m"_kj; // Gray
    break;
  case LogLevel::Debug:
    color_code = "\033[36m"_kj; // Cyan
    break;
  case LogLevel::Info:
    color_code = "\033[32m"_kj; // Green
    break;
  case LogLevel::Warn:
    color_code = "\033[33m"_kj; // Yellow
    break;
  case LogLevel::Error:
    color_code = "\033[31m"_kj; // Red
    break;
  case LogLevel::Critical:
    color_code = "\033[35m"_kj; // Magenta
    break;
  case LogLevel::Off:
    break;
  }
  return kj::str(color_code, text, "\033[0m"_kj);
}

kj::String TextFormatter::format(const LogEntry& entry) const {
  kj::String label = kj::str("["_kj, to_string(entry.level), "]"_kj);

  kj::Vector<kj::StringTree> parts;
  parts.add(kj::strTree("["_kj, format_timestamp(entry.time_point, false), "] "_kj,
                        colorize(entry.level, label), " "_kj, entry.logger, " - "_kj,
                        entry.message));
  for (const auto& field : entry.fields) {
    parts.add(kj::strTree(" "_kj, field.key, "="_kj, quote_if_needed(field.value)));
  }
  return kj::StringTree(parts.releaseAsArray(), ""_kj).flatten();
}

// ============================================================================
// JsonFormatter
// ============================================================================

kj::String JsonFormatter::format(const LogEntry& entry) const {
  auto builder = JsonBuilder::object();
  builder.put("ts"_kj, format_timestamp(entry.time_point, true))
      .put("level"_kj, to_string(entry.level))
      .put("logger"_kj, entry.logger)
      .put("version"_kj, entry.version)
      .put("msg"_kj, entry.message)
      .put("caller"_kj, kj::str(entry.file, ":"_kj, entry.line));
  for (const auto& field : entry.fields) {
    builder.put(field.key, field.value);
  }
  return builder.build();
}

// ============================================================================
// ConsoleOutput
// ============================================================================

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  FILE* out = stdout;
  if (use_stderr_ || entry.level == LogLevel::Error || entry.level == LogLevel::Critical) {
    out = stderr;
  }
  std::fwrite(formatted.begin(), 1, formatted.size(), out);
  std::fputc('\n', out);
}

void ConsoleOutput::flush() {
  std::fflush(stdout);
  std::fflush(stderr);
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(kj::StringPtr name, kj::StringPtr version, kj::Own<LogFormatter> formatter,
               kj::Own<LogOutput> output)
    : name_(kj::str(name)), version_(kj::str(version)) {
  auto lock = guarded_.lockExclusive();
  lock->formatter = kj::mv(formatter);
  lock->outputs.add(kj::mv(output));
}

Logger::~Logger() noexcept {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { flush(); })) {
    KJ_LOG(ERROR, "failed to flush logger", name_, exception);
  }
}

void Logger::set_level(LogLevel level) {
  guarded_.lockExclusive()->level = level;
}

LogLevel Logger::level() const {
  return guarded_.lockShared()->level;
}

bool Logger::enabled(LogLevel level) const {
  auto current = this->level();
  return current != LogLevel::Off && level >= current;
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  guarded_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->outputs.add(kj::mv(output));
}

void Logger::log(LogLevel level, kj::StringPtr message, std::initializer_list<LogField> fields,
                 const std::source_location& location) {
  if (level == LogLevel::Off || !enabled(level)) {
    return;
  }

  LogEntry entry;
  entry.level = level;
  entry.logger = name_;
  entry.version = version_;
  entry.message = kj::str(message);
  entry.fields.reserve(fields.size());
  for (const auto& field : fields) {
    entry.fields.add(LogEntry::Field{kj::str(field.key), kj::str(field.value)});
  }
  entry.file = kj::str(basename_of(location.file_name()));
  entry.line = static_cast<int_least32_t>(location.line());
  entry.time_point = std::chrono::system_clock::now();

  auto lock = guarded_.lockExclusive();
  auto formatted = lock->formatter->format(entry);
  for (auto& output : lock->outputs) {
    output->write(formatted, entry);
  }
}

void Logger::trace(kj::StringPtr message, std::initializer_list<LogField> fields,
                   const std::source_location& location) {
  log(LogLevel::Trace, message, fields, location);
}

void Logger::debug(kj::StringPtr message, std::initializer_list<LogField> fields,
                   const std::source_location& location) {
  log(LogLevel::Debug, message, fields, location);
}

void Logger::info(kj::StringPtr message, std::initializer_list<LogField> fields,
                  const std::source_location& location) {
  log(LogLevel::Info, message, fields, location);
}

void Logger::warn(kj::StringPtr message, std::initializer_list<LogField> fields,
                  const std::source_location& location) {
  log(LogLevel::Warn, message, fields, location);
}

void Logger::error(kj::StringPtr message, std::initializer_list<LogField> fields,
                   const std::source_location& location) {
  log(LogLevel::Error, message, fields, location);
}

void Logger::critical(kj::StringPtr message, std::initializer_list<LogField> fields,
                      const std::source_location& location) {
  log(LogLevel::Critical, message, fields, location);
  flush();
}

void Logger::flush() {
  auto lock = guarded_.lockExclusive();
  for (auto& output : lock->outputs) {
    output->flush();
  }
}

kj::Own<Logger> make_console_logger(kj::StringPtr name, kj::StringPtr version, bool debug) {
  kj::Own<LogFormatter> formatter;
  if (debug) {
    formatter = kj::heap<TextFormatter>(true);
  } else {
    formatter = kj::heap<JsonFormatter>();
  }
  auto logger = kj::heap<Logger>(name, version, kj::mv(formatter), kj::heap<ConsoleOutput>());
  logger->set_level(debug ? LogLevel::Debug : LogLevel::Info);
  return logger;
}

} // namespace doco::core
