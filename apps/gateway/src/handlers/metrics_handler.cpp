#include "handlers/metrics_handler.h"

#include "doco/core/metrics.h"

#include <kj/compat/http.h>
#include <kj/debug.h>

namespace doco::gateway {

// ============================================================================
// MetricsHandler Implementation
// ============================================================================

MetricsHandler::MetricsHandler(core::MetricsRegistry& registry)
    : registry_(registry), process_(registry) {}

Handler MetricsHandler::handler() {
  return [this](RequestContext& ctx) { return handleMetrics(ctx); };
}

kj::Promise<void> MetricsHandler::handleMetrics(RequestContext& ctx) {
  if (!process_.collect()) {
    KJ_LOG(WARNING, "process metrics unavailable");
  }

  auto prometheus_output = registry_.to_prometheus();

  kj::HttpHeaders response_headers(ctx.headerTable);
  response_headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE,
                          "text/plain; version=0.0.4; charset=utf-8"_kj);

  auto stream = ctx.response.send(200, "OK"_kj, response_headers, prometheus_output.size());
  if (ctx.method == kj::HttpMethod::HEAD) {
    return kj::READY_NOW;
  }
  auto writePromise = stream->write(prometheus_output.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(prometheus_output));
}

} // namespace doco::gateway
