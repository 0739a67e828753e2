#pragma once

#include "middleware.h"
#include "session/session_manager.h"

namespace doco::gateway {

/**
 * Binds a session to every request and commits it when the response starts.
 */
class SessionMiddleware : public Middleware {
public:
  explicit SessionMiddleware(SessionManager& manager) : manager_(manager) {}

  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;

private:
  SessionManager& manager_;
};

/**
 * Session gate for authenticated routes: when enabled, a request whose session carries no
 * `user_id` is answered with 401.
 */
class RequireSessionMiddleware : public Middleware {
public:
  explicit RequireSessionMiddleware(bool required) : required_(required) {}

  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;

private:
  bool required_;
};

} // namespace doco::gateway
