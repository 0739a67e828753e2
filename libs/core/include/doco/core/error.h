#pragma once

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace doco::core {

/**
 * @brief Base exception for doco domain errors
 *
 * Carries a message, a kj::Exception type and the throw site. Domain errors travel through
 * KJ promises as kj::Exception, so code throws them with throwException() and callers see
 * an ordinary kj::Exception whose description is the message.
 */
class DocoException {
public:
  explicit DocoException(kj::StringPtr message,
                         kj::Exception::Type type = kj::Exception::Type::FAILED,
                         const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        type_(type) {}

  virtual ~DocoException() noexcept = default;

  DocoException(DocoException&&) = default;
  DocoException& operator=(DocoException&&) = default;

  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }

  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(message_));
  }

  [[noreturn]] void throwException() const {
    kj::throwFatalException(toKjException());
  }

protected:
  kj::String message_;
  kj::String file_;
  int line_;
  kj::Exception::Type type_;
};

class ConfigException : public DocoException {
public:
  explicit ConfigException(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : DocoException(message, kj::Exception::Type::FAILED, location) {}
};

class ValidationException : public DocoException {
public:
  explicit ValidationException(
      kj::StringPtr message, const std::source_location& location = std::source_location::current())
      : DocoException(message, kj::Exception::Type::FAILED, location) {}
};

class NotFoundException : public DocoException {
public:
  explicit NotFoundException(kj::StringPtr message,
                             const std::source_location& location = std::source_location::current())
      : DocoException(message, kj::Exception::Type::FAILED, location) {}
};

/**
 * @brief Template rendering failure; position is the byte offset of the offending action.
 */
class TemplateException : public DocoException {
public:
  explicit TemplateException(kj::StringPtr message, size_t position,
                             const std::source_location& location = std::source_location::current())
      : DocoException(kj::str(message, " at offset "_kj, position), kj::Exception::Type::FAILED,
                      location),
        position_(position) {}

  [[nodiscard]] size_t position() const noexcept {
    return position_;
  }

private:
  size_t position_;
};

/**
 * @brief Short, wire-safe description of an exception (no file, line or trace).
 */
[[nodiscard]] kj::StringPtr describe(const kj::Exception& exception);

} // namespace doco::core
