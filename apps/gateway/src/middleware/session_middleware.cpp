#include "middleware/session_middleware.h"

#include "api_result.h"
#include "error_response.h"

#include "doco/core/http_util.h"

#include <kj/debug.h>

namespace doco::gateway {

kj::Promise<void> SessionMiddleware::process(RequestContext& ctx,
                                             kj::Function<kj::Promise<void>()> next) {
  auto session = manager_.load(core::find_header(ctx.headers, "Cookie"));
  ctx.session = *session;

  // The hook owns the session so it stays valid for as long as the response can start.
  ctx.response.on_send(
      [this, session = kj::mv(session)](kj::uint, kj::HttpHeaders& headers) mutable {
        manager_.commit(*session, headers);
      });
  return next();
}

kj::Promise<void> RequireSessionMiddleware::process(RequestContext& ctx,
                                                    kj::Function<kj::Promise<void>()> next) {
  if (!required_) {
    return next();
  }
  KJ_IF_SOME(session, ctx.session) {
    if (session.exists("user_id")) {
      return next();
    }
  }
  ErrorResponse error(KJ_EXCEPTION(FAILED, "unauthorized"), "authentication required"_kj);
  return send_error(ctx, 401, error);
}

} // namespace doco::gateway
