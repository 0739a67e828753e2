#pragma once

#include "middleware.h"

#include "doco/core/logger.h"
#include "doco/core/metrics.h"

namespace doco::gateway {

/**
 * One structured log line per request, plus the HTTP request metrics.
 *
 * Metrics:
 * - doco_http_requests_total
 * - doco_http_request_errors_total (status >= 500)
 * - doco_http_requests_in_flight
 * - doco_http_request_duration_seconds
 */
class RequestLoggerMiddleware : public Middleware {
public:
  RequestLoggerMiddleware(core::Logger& logger, core::MetricsRegistry& registry);
  ~RequestLoggerMiddleware() noexcept override;

  kj::Promise<void> process(RequestContext& ctx,
                            kj::Function<kj::Promise<void>()> next) override;

  /**
   * Record one finished request (public for testing).
   */
  void record_request(const RequestContext& ctx, kj::uint status, double duration_sec);

private:
  core::Logger& logger_;
  core::Counter& requests_total_;
  core::Counter& request_errors_;
  core::Gauge& in_flight_;
  core::Histogram& request_duration_;
};

} // namespace doco::gateway
