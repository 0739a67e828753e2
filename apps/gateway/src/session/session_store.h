#pragma once

#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::gateway {

/**
 * Persistence for encoded session data, keyed by token.
 *
 * Implementations must be safe to call from any thread.
 */
class SessionStore {
public:
  virtual ~SessionStore() noexcept = default;

  /**
   * Encoded data for token, or none when it is unknown or expired.
   */
  virtual kj::Maybe<kj::String> find(kj::StringPtr token) = 0;

  /**
   * Insert or replace the data for token.
   */
  virtual void commit(kj::StringPtr token, kj::StringPtr data, kj::Date expiry) = 0;

  virtual void remove(kj::StringPtr token) = 0;
};

} // namespace doco::gateway
