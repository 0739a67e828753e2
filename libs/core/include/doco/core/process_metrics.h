#pragma once

#include "doco/core/metrics.h"

#include <kj/common.h>
#include <kj/string.h>

namespace doco::core {

/**
 * @brief Snapshot of the current process, read from /proc/self on Linux.
 */
struct ProcessStats {
  double cpu_seconds = 0.0;
  double resident_memory_bytes = 0.0;
  double virtual_memory_bytes = 0.0;
  double start_time_seconds = 0.0;
  double open_fds = 0.0;
  double threads = 0.0;
};

/**
 * @brief Parse the contents of /proc/<pid>/stat.
 *
 * start_time_seconds is relative to boot; open_fds is left at zero.
 * @throws kj::Exception if the text is truncated or malformed
 */
[[nodiscard]] ProcessStats parse_proc_stat(kj::StringPtr stat_line, long clock_ticks,
                                           long page_size);

/**
 * @brief Keeps the standard process_* gauges of a registry up to date.
 *
 * collect() is cheap enough to run on every scrape.
 */
class ProcessMetricsCollector final {
public:
  explicit ProcessMetricsCollector(MetricsRegistry& registry);

  /**
   * @brief Refresh the gauges. Returns false when /proc is unavailable; the gauges then keep
   * their previous values.
   */
  bool collect();

private:
  Gauge& cpu_seconds_;
  Gauge& resident_memory_;
  Gauge& virtual_memory_;
  Gauge& start_time_;
  Gauge& open_fds_;
  Gauge& threads_;
};

} // namespace doco::core
