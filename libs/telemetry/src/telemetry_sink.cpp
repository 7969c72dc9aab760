#include "stablecore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>
#include <cmath>

namespace stablecore {
namespace telemetry {

void LatencyHistogram::add(std::chrono::nanoseconds latency) noexcept {
  const auto ns = latency.count() > 0 ? static_cast<std::uint64_t>(latency.count()) : 0;
  const auto bucket = std::min<std::size_t>(std::bit_width(ns), kBuckets - 1);
  ++buckets_[bucket];
  shortest_ = count_ == 0 ? latency : std::min(shortest_, latency);
  longest_ = count_ == 0 ? latency : std::max(longest_, latency);
  total_ += latency;
  ++count_;
}

std::chrono::nanoseconds LatencyHistogram::average() const noexcept {
  if (count_ == 0) {
    return std::chrono::nanoseconds{0};
  }
  return total_ / static_cast<std::int64_t>(count_);
}

std::chrono::nanoseconds LatencyHistogram::quantile_bound(double q) const noexcept {
  if (count_ == 0) {
    return std::chrono::nanoseconds{0};
  }
  const auto rank = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::ceil(q * static_cast<double>(count_))));
  std::uint64_t seen = 0;
  for (std::size_t bucket = 0; bucket + 1 < kBuckets; ++bucket) {
    seen += buckets_[bucket];
    if (seen >= rank) {
      return std::min(std::chrono::nanoseconds{std::int64_t{1} << bucket}, longest_);
    }
  }
  return longest_;
}

void TelemetrySink::increment(MetricId id, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  counters_[id] += delta;
}

void TelemetrySink::record_latency(MetricId id, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  latencies_[id].add(latency);
}

std::int64_t TelemetrySink::counter(MetricId id) const {
  std::scoped_lock lock(mutex_);
  const auto it = counters_.find(id);
  return it == counters_.end() ? 0 : it->second;
}

std::map<MetricId, std::int64_t> TelemetrySink::counters() const {
  std::scoped_lock lock(mutex_);
  return counters_;
}

std::vector<LatencyReport> TelemetrySink::take_latency_reports() {
  std::map<MetricId, LatencyHistogram> window;
  {
    std::scoped_lock lock(mutex_);
    window.swap(latencies_);
  }

  std::vector<LatencyReport> reports;
  reports.reserve(window.size());
  for (const auto& [id, histogram] : window) {
    reports.push_back(LatencyReport{
        .id = id,
        .count = histogram.count(),
        .average = histogram.average(),
        .p50 = histogram.quantile_bound(0.50),
        .p99 = histogram.quantile_bound(0.99),
        .longest = histogram.longest(),
    });
  }
  return reports;
}

}  // namespace telemetry
}  // namespace stablecore
