#pragma once

#include "middleware.h"

#include <atomic>
#include <kj/string.h>

namespace doco::gateway {

/**
 * Tags every request with an id.
 *
 * An incoming X-Request-Id is kept. Otherwise the id is `<host>/<random>-<counter>`, the
 * counter zero-padded to six digits. The id is stored in RequestContext::requestId and
 * echoed in the X-Request-Id response header.
 */
class RequestIdMiddleware : public Middleware {
public:
  RequestIdMiddleware();
  explicit RequestIdMiddleware(kj::String prefix);

  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;

  kj::StringPtr prefix() const {
    return prefix_;
  }

  kj::String next_id();

private:
  kj::String prefix_;
  std::atomic<uint64_t> counter_{0};
};

} // namespace doco::gateway
