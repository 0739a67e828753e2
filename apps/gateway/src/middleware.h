#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/function.h>
#include <kj/string.h>

namespace doco::gateway {

/**
 * Base interface for middleware components.
 *
 * Middleware components can intercept HTTP requests before they reach
 * handlers, and can change responses through ResponseWriter::on_send().
 *
 * Middleware process() methods receive:
 * - ctx: The request context
 * - next: A callable that invokes the next middleware/handler in the chain
 *
 * Typical middleware pattern:
 * 1. Process request (e.g., request id, session, logging)
 * 2. Optionally modify the context or return early
 * 3. Call next() to continue the chain (or return early to short-circuit)
 */
class Middleware {
public:
  virtual ~Middleware() noexcept = default;

  /**
   * Process the request through this middleware.
   *
   * @param ctx The request context
   * @param next Function to call to continue to next middleware/handler
   * @return Promise that completes when request processing is done
   */
  virtual kj::Promise<void> process(RequestContext& ctx,
                                    kj::Function<kj::Promise<void>()> next) = 0;
};

using Handler = kj::Function<kj::Promise<void>(RequestContext&)>;

/**
 * Run ctx through middlewares in order, ending at handler.
 */
kj::Promise<void> run_chain(kj::ArrayPtr<Middleware* const> middlewares, RequestContext& ctx,
                            Handler& handler);

} // namespace doco::gateway
