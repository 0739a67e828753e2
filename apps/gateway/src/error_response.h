#pragma once

#include <kj/exception.h>
#include <kj/string.h>

namespace doco::gateway {

/**
 * The `{err, message}` envelope sent for every API error.
 *
 * Only the two strings go on the wire; the wrapped exception stays available for logs.
 */
class ErrorResponse {
public:
  /**
   * @param message Override for the message field; defaults to the error description
   */
  explicit ErrorResponse(kj::Exception error, kj::Maybe<kj::StringPtr> message = kj::none);

  kj::StringPtr err() const {
    return err_;
  }
  kj::StringPtr message() const {
    return message_;
  }
  const kj::Exception& unwrap() const {
    return inner_;
  }

  kj::String to_json() const;

private:
  kj::Exception inner_;
  kj::String err_;
  kj::String message_;
};

} // namespace doco::gateway
