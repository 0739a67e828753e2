#pragma once

#include <kj/common.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::gateway {

enum class SessionStatus { Unmodified, Modified, Destroyed };

/**
 * Per-request view of a session: a string key/value map, an expiry and a token.
 *
 * A new session has an empty token; the SessionManager issues one when the session is first
 * committed. Sessions are not shared between requests.
 */
class Session {
public:
  Session(kj::String token, kj::Date expiry);
  KJ_DISALLOW_COPY_AND_MOVE(Session);

  kj::StringPtr token() const {
    return token_;
  }
  kj::Date expiry() const {
    return expiry_;
  }
  SessionStatus status() const {
    return status_;
  }

  kj::Maybe<kj::StringPtr> get(kj::StringPtr key) const;
  bool exists(kj::StringPtr key) const;
  void put(kj::StringPtr key, kj::StringPtr value);
  void remove(kj::StringPtr key);

  /**
   * Drop all data. The session is removed from the store and its cookie expired.
   */
  void destroy();

  size_t size() const {
    return values_.size();
  }

  /**
   * Serialized form kept by a SessionStore: `{"deadline": <unix seconds>, "values": {...}}`.
   */
  kj::String encode() const;

  /**
   * Restore a session from encode() output.
   *
   * @throws ValidationException when data is not a session document
   */
  static kj::Own<Session> decode(kj::StringPtr token, kj::StringPtr data);

private:
  friend class SessionManager;

  kj::String token_;
  kj::Date expiry_;
  SessionStatus status_ = SessionStatus::Unmodified;
  kj::HashMap<kj::String, kj::String> values_;
};

} // namespace doco::gateway
