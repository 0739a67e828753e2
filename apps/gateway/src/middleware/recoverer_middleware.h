#pragma once

#include "middleware.h"

#include "doco/core/logger.h"

namespace doco::gateway {

/**
 * Turns an exception escaping the inner chain into a 500 error envelope.
 *
 * If the response already started there is nothing to recover; the exception is rethrown
 * so the server aborts the connection.
 */
class RecovererMiddleware : public Middleware {
public:
  explicit RecovererMiddleware(core::Logger& logger) : logger_(logger) {}

  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;

private:
  core::Logger& logger_;
};

} // namespace doco::gateway
