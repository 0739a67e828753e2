#pragma once

#include "session/session.h"
#include "session/session_store.h"

#include <kj/compat/http.h>
#include <kj/time.h>

namespace doco::gateway {

/**
 * Loads sessions from the `session` cookie and commits them back to a SessionStore.
 *
 * One manager is constructed at startup and shared by every request.
 */
class SessionManager {
public:
  struct Config {
    kj::String cookieName = kj::str("session");
    kj::Duration lifetime = 24 * kj::HOURS;
    kj::String cookiePath = kj::str("/");
    bool httpOnly = true;
    bool secure = false;
    kj::String sameSite = kj::str("Lax");
  };

  SessionManager(SessionStore& store, const kj::Clock& clock, Config config);
  SessionManager(SessionStore& store, const kj::Clock& clock);

  const Config& config() const {
    return config_;
  }

  /**
   * Session named by the request's cookie header, or a fresh one when the cookie is missing,
   * unknown, expired or unreadable.
   */
  kj::Own<Session> load(kj::Maybe<kj::StringPtr> cookieHeader);

  /**
   * Persist a modified session or remove a destroyed one, adding the matching Set-Cookie
   * to headers. Unmodified sessions leave headers untouched.
   */
  void commit(Session& session, kj::HttpHeaders& headers);

private:
  SessionStore& store_;
  const kj::Clock& clock_;
  Config config_;

  kj::String make_cookie(kj::StringPtr value, kj::Date expires, int64_t maxAge) const;
};

/**
 * Value of the named cookie in a Cookie header, or none.
 */
kj::Maybe<kj::String> find_cookie(kj::StringPtr header, kj::StringPtr name);

} // namespace doco::gateway
