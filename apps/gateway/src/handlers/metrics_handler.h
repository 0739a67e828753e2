#pragma once

#include "middleware.h"
#include "request_context.h"

#include "doco/core/process_metrics.h"

#include <kj/async.h>
#include <kj/string.h>

namespace doco::gateway {

/**
 * Prometheus metrics handler.
 *
 * Handles endpoint:
 * - GET /api/metrics - Prometheus metrics exposition
 *
 * Process metrics are refreshed from /proc on every scrape.
 */
class MetricsHandler {
public:
  explicit MetricsHandler(core::MetricsRegistry& registry);

  /**
   * Handle GET /api/metrics
   *
   * Returns Prometheus format metrics text.
   * Format:
   * # HELP metric_name Description
   * # TYPE metric_name counter|gauge|histogram
   * metric_name value
   * metric_name_bucket{le="0.005"} count
   * ...
   */
  kj::Promise<void> handleMetrics(RequestContext& ctx);

  Handler handler();

private:
  core::MetricsRegistry& registry_;
  core::ProcessMetricsCollector process_;
};

} // namespace doco::gateway
