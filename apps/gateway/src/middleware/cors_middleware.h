#pragma once

#include "middleware.h"
#include "request_context.h"

#include <kj/string.h>
#include <kj/vector.h>

namespace doco::gateway {

/**
 * CORS middleware.
 *
 * Answers preflight requests and adds CORS headers to the responses of actual requests.
 * Configurable origins, methods, and headers.
 */
class CorsMiddleware : public Middleware {
public:
  struct Config {
    kj::Vector<kj::String> allowedOrigins; // "*" for all origins
    kj::Vector<kj::String> allowedMethods;
    kj::Vector<kj::String> allowedHeaders;
    kj::Vector<kj::String> exposedHeaders;
    bool allowCredentials = false;
    int maxAge = 0; // Preflight cache in seconds, 0 to omit
  };

  /**
   * The API's policy: any origin, the usual REST methods, credentials, five minute preflight.
   */
  static Config default_config();

  explicit CorsMiddleware(Config&& config);
  ~CorsMiddleware() noexcept override;

  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;

  bool is_origin_allowed(kj::StringPtr origin) const;
  bool is_method_allowed(kj::StringPtr method) const;

  /**
   * Whether every entry of a comma-separated Access-Control-Request-Headers value is allowed.
   */
  bool are_headers_allowed(kj::StringPtr requested) const;

private:
  Config config_;
  bool allowAllOrigins_ = false;
  kj::String methodsValue_;
  kj::String headersValue_;
  kj::String exposedValue_;

  kj::Promise<void> handle_preflight(RequestContext& ctx, kj::StringPtr origin);

  kj::String allow_origin_value(kj::StringPtr origin) const;
};

} // namespace doco::gateway
