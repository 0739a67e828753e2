#include "middleware.h"

namespace doco::gateway {

kj::Promise<void> run_chain(kj::ArrayPtr<Middleware* const> middlewares, RequestContext& ctx,
                            Handler& handler) {
  if (middlewares.size() == 0) {
    return handler(ctx);
  }
  auto rest = middlewares.slice(1, middlewares.size());
  return middlewares[0]->process(
      ctx, [rest, &ctx, &handler]() { return run_chain(rest, ctx, handler); });
}

} // namespace doco::gateway
