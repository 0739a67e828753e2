#include "middleware/request_logger_middleware.h"

#include <kj/common.h>
#include <kj/debug.h>

namespace doco::gateway {

RequestLoggerMiddleware::RequestLoggerMiddleware(core::Logger& logger,
                                                 core::MetricsRegistry& registry)
    : logger_(logger),
      requests_total_(registry.register_counter("doco_http_requests_total", "Total HTTP requests")),
      request_errors_(registry.register_counter("doco_http_request_errors_total",
                                                "HTTP requests answered with a 5xx status")),
      in_flight_(registry.register_gauge("doco_http_requests_in_flight",
                                         "HTTP requests currently being served")),
      request_duration_(registry.register_histogram("doco_http_request_duration_seconds",
                                                    "Request duration in seconds")) {}

RequestLoggerMiddleware::~RequestLoggerMiddleware() noexcept = default;

kj::Promise<void> RequestLoggerMiddleware::process(RequestContext& ctx,
                                                   kj::Function<kj::Promise<void>()> next) {
  in_flight_.increment();
  core::Timer timer;

  return kj::evalNow([&]() { return next(); })
      .then([this, &ctx, timer]() {
        record_request(ctx, ctx.response.status(), timer.elapsed_seconds());
      })
      .catch_([this, &ctx, timer](kj::Exception&& e) -> kj::Promise<void> {
        // An exception that got this far aborts the connection
        kj::uint status = ctx.response.started() ? ctx.response.status() : 500;
        record_request(ctx, status, timer.elapsed_seconds());
        return kj::mv(e);
      })
      .attach(kj::defer([this]() { in_flight_.decrement(); }));
}

void RequestLoggerMiddleware::record_request(const RequestContext& ctx, kj::uint status,
                                             double duration_sec) {
  requests_total_.increment();
  if (status >= 500) {
    request_errors_.increment();
  }
  request_duration_.observe(duration_sec);

  auto method = kj::str(ctx.method);
  auto statusText = kj::str(status);
  auto bytes = kj::str(ctx.response.bytes_written());
  auto duration = kj::str(duration_sec * 1000.0, "ms");
  logger_.info("request", {{"method", method},
                           {"path", ctx.path},
                           {"status", statusText},
                           {"bytes", bytes},
                           {"duration", duration},
                           {"remote", ctx.clientIP},
                           {"request_id", ctx.requestId}});
}

} // namespace doco::gateway
