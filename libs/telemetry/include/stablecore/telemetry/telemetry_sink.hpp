#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace stablecore {
namespace telemetry {

using MetricId = std::uint16_t;

// Latency distribution in power-of-two nanosecond buckets. Bucket i holds
// values whose bit width is i; the last one also takes everything above ~1s.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void add(std::chrono::nanoseconds latency) noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::chrono::nanoseconds shortest() const noexcept { return shortest_; }
  [[nodiscard]] std::chrono::nanoseconds longest() const noexcept { return longest_; }
  [[nodiscard]] std::chrono::nanoseconds average() const noexcept;

  // Upper edge of the bucket holding quantile q in (0, 1], capped at the
  // longest latency seen.
  [[nodiscard]] std::chrono::nanoseconds quantile_bound(double q) const noexcept;

 private:
  std::array<std::uint64_t, kBuckets> buckets_{};
  std::uint64_t count_{0};
  std::chrono::nanoseconds total_{0};
  std::chrono::nanoseconds shortest_{0};
  std::chrono::nanoseconds longest_{0};
};

struct LatencyReport {
  MetricId id{0};
  std::uint64_t count{0};
  std::chrono::nanoseconds average{0};
  std::chrono::nanoseconds p50{0};
  std::chrono::nanoseconds p99{0};
  std::chrono::nanoseconds longest{0};
};

// Named counters plus one latency histogram per metric, shared by every
// component that reports into it.
class TelemetrySink {
 public:
  void increment(MetricId id, std::int64_t delta = 1);
  void record_latency(MetricId id, std::chrono::nanoseconds latency);

  [[nodiscard]] std::int64_t counter(MetricId id) const;
  [[nodiscard]] std::map<MetricId, std::int64_t> counters() const;

  // One report per metric with latencies since the last call, ascending by
  // id. Counters are cumulative and are not reset.
  [[nodiscard]] std::vector<LatencyReport> take_latency_reports();

 private:
  mutable std::mutex mutex_;
  std::map<MetricId, std::int64_t> counters_{};
  std::map<MetricId, LatencyHistogram> latencies_{};
};

}  // namespace telemetry
}  // namespace stablecore
