#include "doco/core/metrics.h"

#include <cmath>
#include <kj/string-tree.h>

namespace doco::core {

kj::String format_metric_value(double value) {
  if (std::isnan(value)) {
    return kj::str("NaN"_kj);
  }
  if (std::isinf(value)) {
    return kj::str(value > 0 ? "+Inf"_kj : "-Inf"_kj);
  }
  if (value == std::floor(value) && std::fabs(value) < 1e15) {
    return kj::str(static_cast<int64_t>(value));
  }
  return kj::str(value);
}

Counter& MetricsRegistry::register_counter(kj::StringPtr name, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  auto& counter = lock->counters.findOrCreate(name, [&]() {
    return kj::TreeMap<kj::String, kj::Own<Counter>>::Entry{kj::str(name),
                                                            kj::heap<Counter>(name, description)};
  });
  return *counter;
}

Gauge& MetricsRegistry::register_gauge(kj::StringPtr name, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  auto& gauge = lock->gauges.findOrCreate(name, [&]() {
    return kj::TreeMap<kj::String, kj::Own<Gauge>>::Entry{kj::str(name),
                                                          kj::heap<Gauge>(name, description)};
  });
  return *gauge;
}

Histogram& MetricsRegistry::register_histogram(kj::StringPtr name, kj::StringPtr description,
                                               std::vector<double> buckets) {
  auto lock = guarded_.lockExclusive();
  auto& histogram = lock->histograms.findOrCreate(name, [&]() {
    return kj::TreeMap<kj::String, kj::Own<Histogram>>::Entry{
        kj::str(name), kj::heap<Histogram>(name, description, kj::mv(buckets))};
  });
  return *histogram;
}

kj::Maybe<Counter&> MetricsRegistry::counter(kj::StringPtr name) {
  auto lock = guarded_.lockExclusive();
  KJ_IF_SOME(value, lock->counters.find(name)) {
    return *value;
  }
  return kj::none;
}

kj::Maybe<Gauge&> MetricsRegistry::gauge(kj::StringPtr name) {
  auto lock = guarded_.lockExclusive();
  KJ_IF_SOME(value, lock->gauges.find(name)) {
    return *value;
  }
  return kj::none;
}

kj::Maybe<Histogram&> MetricsRegistry::histogram(kj::StringPtr name) {
  auto lock = guarded_.lockExclusive();
  KJ_IF_SOME(value, lock->histograms.find(name)) {
    return *value;
  }
  return kj::none;
}

namespace {

void add_header(kj::Vector<kj::StringTree>& lines, const Metric& metric, kj::StringPtr type) {
  if (metric.description().size() > 0) {
    lines.add(kj::strTree("# HELP "_kj, metric.name(), " "_kj, metric.description(), "\n"_kj));
  }
  lines.add(kj::strTree("# TYPE "_kj, metric.name(), " "_kj, type, "\n"_kj));
}

} // namespace

kj::String MetricsRegistry::to_prometheus() const {
  auto lock = guarded_.lockExclusive();

  kj::Vector<kj::StringTree> lines;

  for (const auto& entry : lock->counters) {
    add_header(lines, *entry.value, "counter"_kj);
    lines.add(kj::strTree(entry.key, " "_kj, entry.value->value(), "\n"_kj));
  }

  for (const auto& entry : lock->gauges) {
    add_header(lines, *entry.value, "gauge"_kj);
    lines.add(
        kj::strTree(entry.key, " "_kj, format_metric_value(entry.value->value()), "\n"_kj));
  }

  for (const auto& entry : lock->histograms) {
    const auto& name = entry.key;
    const auto& histogram = *entry.value;
    add_header(lines, histogram, "histogram"_kj);
    auto counts = histogram.bucket_counts();
    for (size_t i = 0; i < histogram.buckets().size(); ++i) {
      lines.add(kj::strTree(name, "_bucket{le=\""_kj, format_metric_value(histogram.buckets()[i]),
                            "\"} "_kj, counts[i], "\n"_kj));
    }
    lines.add(kj::strTree(name, "_bucket{le=\"+Inf\"} "_kj, histogram.count(), "\n"_kj));
    lines.add(kj::strTree(name, "_sum "_kj, format_metric_value(histogram.sum()), "\n"_kj));
    lines.add(kj::strTree(name, "_count "_kj, histogram.count(), "\n"_kj));
  }

  return kj::StringTree(lines.releaseAsArray(), ""_kj).flatten();
}

} // namespace doco::core
