#pragma once

#include "middleware.h"

namespace doco::gateway {

/**
 * Replaces RequestContext::clientIP with the address the proxy reported.
 *
 * Order: X-Real-IP, then the first X-Forwarded-For entry, else the TCP peer stays.
 */
class RealIpMiddleware : public Middleware {
public:
  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;
};

/**
 * The client address for a request given its headers, or none to keep the peer address.
 */
kj::Maybe<kj::String> real_ip(const kj::HttpHeaders& headers);

} // namespace doco::gateway
