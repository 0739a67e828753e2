#pragma once

#include <atomic>
#include <chrono>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <memory>
#include <vector> // bucket bounds and counts are handed out as std::vector

namespace doco::core {

enum class MetricType { Counter, Gauge, Histogram };

class Metric {
public:
  explicit Metric(kj::StringPtr name, kj::StringPtr description)
      : name_(kj::heapString(name)), description_(kj::heapString(description)) {}
  virtual ~Metric() noexcept = default;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] kj::StringPtr description() const noexcept {
    return description_;
  }
  [[nodiscard]] virtual MetricType type() const noexcept = 0;

private:
  kj::String name_;
  kj::String description_;
};

// Monotonically increasing counter
class Counter final : public Metric {
public:
  explicit Counter(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    count_ += value;
  }

  [[nodiscard]] int64_t value() const noexcept {
    return count_.load();
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Counter;
  }

private:
  std::atomic<int64_t> count_{0};
};

// Gauge; holds a double so that process metrics (seconds, bytes) fit without scaling
class Gauge final : public Metric {
public:
  explicit Gauge(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(double value = 1.0) noexcept {
    value_.fetch_add(value);
  }
  void decrement(double value = 1.0) noexcept {
    value_.fetch_sub(value);
  }
  void set(double value) noexcept {
    value_.store(value);
  }

  [[nodiscard]] double value() const noexcept {
    return value_.load();
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Gauge;
  }

private:
  std::atomic<double> value_{0.0};
};

// Steady-clock stopwatch for latency measurements
class Timer final {
public:
  Timer() : start_time_(std::chrono::steady_clock::now()) {}

  [[nodiscard]] double elapsed_seconds() const noexcept {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
  }

  [[nodiscard]] std::chrono::microseconds elapsed_us() const noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                 start_time_);
  }

private:
  std::chrono::steady_clock::time_point start_time_;
};

class Histogram final : public Metric {
public:
  explicit Histogram(kj::StringPtr name, kj::StringPtr description,
                     std::vector<double> buckets = default_buckets())
      : Metric(name, description), buckets_(kj::mv(buckets)) {
    bucket_counts_ = std::make_unique<std::atomic<int64_t>[]>(buckets_.size());
    for (size_t i = 0; i < buckets_.size(); ++i) {
      bucket_counts_[i].store(0);
    }
  }

  void observe(double value) noexcept {
    count_++;
    sum_.fetch_add(value);
    for (size_t i = 0; i < buckets_.size(); ++i) {
      if (value <= buckets_[i]) {
        bucket_counts_[i].fetch_add(1);
      }
    }
  }

  [[nodiscard]] int64_t count() const noexcept {
    return count_.load();
  }
  [[nodiscard]] double sum() const noexcept {
    return sum_.load();
  }
  [[nodiscard]] const std::vector<double>& buckets() const noexcept {
    return buckets_;
  }
  [[nodiscard]] std::vector<int64_t> bucket_counts() const {
    std::vector<int64_t> counts;
    counts.reserve(buckets_.size());
    for (size_t i = 0; i < buckets_.size(); ++i) {
      counts.push_back(bucket_counts_[i].load());
    }
    return counts;
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Histogram;
  }

  // Request latency buckets in seconds
  static std::vector<double> default_buckets() {
    return {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
  }

private:
  std::vector<double> buckets_;
  std::unique_ptr<std::atomic<int64_t>[]> bucket_counts_;
  std::atomic<int64_t> count_{0};
  std::atomic<double> sum_{0.0};
};

/**
 * @brief Named metric registry with Prometheus text export
 *
 * register_* is idempotent: registering an existing name returns the existing metric.
 * Returned references stay valid for the registry's lifetime.
 */
class MetricsRegistry final {
public:
  MetricsRegistry() = default;
  KJ_DISALLOW_COPY_AND_MOVE(MetricsRegistry);

  Counter& register_counter(kj::StringPtr name, kj::StringPtr description);
  Gauge& register_gauge(kj::StringPtr name, kj::StringPtr description);
  Histogram& register_histogram(kj::StringPtr name, kj::StringPtr description,
                                std::vector<double> buckets = Histogram::default_buckets());

  [[nodiscard]] kj::Maybe<Counter&> counter(kj::StringPtr name);
  [[nodiscard]] kj::Maybe<Gauge&> gauge(kj::StringPtr name);
  [[nodiscard]] kj::Maybe<Histogram&> histogram(kj::StringPtr name);

  /**
   * @brief Export every metric in Prometheus text exposition format 0.0.4, sorted by name
   */
  [[nodiscard]] kj::String to_prometheus() const;

private:
  struct RegistryState {
    kj::TreeMap<kj::String, kj::Own<Counter>> counters;
    kj::TreeMap<kj::String, kj::Own<Gauge>> gauges;
    kj::TreeMap<kj::String, kj::Own<Histogram>> histograms;
  };

  kj::MutexGuarded<RegistryState> guarded_;
};

/**
 * @brief Format a double the way the Prometheus text format expects ("+Inf", integers without
 * a fraction, otherwise shortest round-trip form).
 */
[[nodiscard]] kj::String format_metric_value(double value);

} // namespace doco::core
