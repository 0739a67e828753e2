#include "middleware/recoverer_middleware.h"

#include "api_result.h"
#include "error_response.h"

#include "doco/core/error.h"

namespace doco::gateway {

kj::Promise<void> RecovererMiddleware::process(RequestContext& ctx,
                                               kj::Function<kj::Promise<void>()> next) {
  return kj::evalNow([&]() { return next(); })
      .catch_([this, &ctx](kj::Exception&& e) -> kj::Promise<void> {
        logger_.error("recovered from handler failure", {{"request_id", ctx.requestId},
                                                         {"path", ctx.path},
                                                         {"error", core::describe(e)}});
        if (ctx.response.started()) {
          return kj::mv(e);
        }
        ErrorResponse error(kj::mv(e));
        return send_error(ctx, 500, error).attach(kj::mv(error));
      });
}

} // namespace doco::gateway
