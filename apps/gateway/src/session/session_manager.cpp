#include "session/session_manager.h"

#include "util/random.h"

#include "doco/core/error.h"
#include "doco/core/http_util.h"

#include <kj/debug.h>

namespace doco::gateway {

namespace {

constexpr size_t kTokenBytes = 32;

bool is_space(char c) {
  return c == ' ' || c == '\t';
}

} // namespace

kj::Maybe<kj::String> find_cookie(kj::StringPtr header, kj::StringPtr name) {
  size_t pos = 0;
  while (pos < header.size()) {
    while (pos < header.size() && is_space(header[pos])) {
      ++pos;
    }
    size_t end = pos;
    while (end < header.size() && header[end] != ';') {
      ++end;
    }

    auto pair = header.slice(pos, end);
    size_t eq = 0;
    while (eq < pair.size() && pair[eq] != '=') {
      ++eq;
    }
    if (eq < pair.size() && pair.first(eq) == name.asArray()) {
      auto value = pair.slice(eq + 1, pair.size());
      size_t valueEnd = value.size();
      while (valueEnd > 0 && is_space(value[valueEnd - 1])) {
        --valueEnd;
      }
      return kj::heapString(value.first(valueEnd));
    }
    pos = end + 1;
  }
  return kj::none;
}

SessionManager::SessionManager(SessionStore& store, const kj::Clock& clock, Config config)
    : store_(store), clock_(clock), config_(kj::mv(config)) {}

SessionManager::SessionManager(SessionStore& store, const kj::Clock& clock)
    : SessionManager(store, clock, Config{}) {}

kj::Own<Session> SessionManager::load(kj::Maybe<kj::StringPtr> cookieHeader) {
  KJ_IF_SOME(header, cookieHeader) {
    KJ_IF_SOME(token, find_cookie(header, config_.cookieName)) {
      KJ_IF_SOME(data, store_.find(token)) {
        kj::Maybe<kj::Own<Session>> loaded;
        KJ_IF_SOME(e, kj::runCatchingExceptions([&]() { loaded = Session::decode(token, data); })) {
          KJ_LOG(WARNING, "discarding unreadable session", core::describe(e));
        }
        KJ_IF_SOME(session, loaded) {
          return kj::mv(session);
        }
      }
    }
  }
  return kj::heap<Session>(kj::String(), clock_.now() + config_.lifetime);
}

void SessionManager::commit(Session& session, kj::HttpHeaders& headers) {
  switch (session.status()) {
  case SessionStatus::Unmodified:
    return;
  case SessionStatus::Modified: {
    if (session.token_.size() == 0) {
      session.token_ = random_token(kTokenBytes);
    }
    store_.commit(session.token_, session.encode(), session.expiry_);
    auto maxAge = (session.expiry_ - clock_.now()) / kj::SECONDS + 1;
    headers.addPtr("Set-Cookie", make_cookie(session.token_, session.expiry_ + 1 * kj::SECONDS,
                                             maxAge < 0 ? 0 : maxAge));
    break;
  }
  case SessionStatus::Destroyed:
    if (session.token_.size() > 0) {
      store_.remove(session.token_);
    }
    headers.addPtr("Set-Cookie", make_cookie("", kj::UNIX_EPOCH + 1 * kj::SECONDS, 0));
    break;
  }

  headers.addPtrPtr("Vary", "Cookie");
  headers.addPtrPtr("Cache-Control", "no-cache=\"Set-Cookie\"");
}

kj::String SessionManager::make_cookie(kj::StringPtr value, kj::Date expires,
                                       int64_t maxAge) const {
  return kj::str(config_.cookieName, "=", value, "; Path=", config_.cookiePath,
                 "; Expires=", core::format_http_date(expires), "; Max-Age=", maxAge,
                 config_.httpOnly ? "; HttpOnly" : "", config_.secure ? "; Secure" : "",
                 config_.sameSite.size() > 0 ? "; SameSite=" : "", config_.sameSite);
}

} // namespace doco::gateway
