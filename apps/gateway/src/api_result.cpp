#include "api_result.h"

#include <kj/debug.h>

namespace doco::gateway {

ApiResult ApiResult::json(kj::uint status, kj::String body) {
  ApiResult result;
  result.status = status;
  result.body = kj::mv(body);
  return result;
}

ApiResult ApiResult::failure(kj::uint status, kj::Exception error,
                             kj::Maybe<kj::StringPtr> message) {
  ApiResult result;
  result.status = status;
  result.error = kj::mv(error);
  KJ_IF_SOME(m, message) {
    result.message = kj::str(m);
  }
  return result;
}

kj::Promise<void> send_error(RequestContext& ctx, kj::uint status, const ErrorResponse& error) {
  return ctx.sendJson(status, error.to_json());
}

Handler with_error(ApiHandler handler) {
  return [handler = kj::mv(handler)](RequestContext& ctx) mutable -> kj::Promise<void> {
    return handler(ctx).then([&ctx](ApiResult result) -> kj::Promise<void> {
      KJ_IF_SOME(error, result.error) {
        kj::Maybe<kj::StringPtr> message;
        KJ_IF_SOME(m, result.message) {
          message = m.asPtr();
        }
        ErrorResponse response(kj::mv(error), message);
        KJ_LOG(WARNING, "request failed", ctx.requestId, result.status, response.err());
        return send_error(ctx, result.status, response);
      }
      KJ_IF_SOME(body, result.body) {
        return ctx.sendJson(result.status, kj::mv(body));
      }
      ErrorResponse response(KJ_EXCEPTION(FAILED, "no response"), "no response"_kj);
      return send_error(ctx, result.status, response);
    });
  };
}

} // namespace doco::gateway
