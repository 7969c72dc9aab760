#pragma once

#include <string_view>

#include "stablecore/telemetry/telemetry_sink.hpp"

namespace stablecore {
namespace engine {

// Counter layout: operation id for attempts and latency, id + kFailureOffset
// for failed attempts.
enum class Metric : telemetry::MetricId {
  kDeposit = 1,
  kMint = 2,
  kRedeem = 3,
  kBurn = 4,
  kDepositAndMint = 5,
  kRedeemAndBurn = 6,
  kLiquidate = 7,
  kRestore = 8,
  kReentrancyRejected = 20,
  kCompensationFailed = 21,
  kEventsPublished = 22,
};

inline constexpr telemetry::MetricId kFailureOffset = 100;

inline constexpr telemetry::MetricId id(Metric metric) noexcept {
  return static_cast<telemetry::MetricId>(metric);
}

inline constexpr telemetry::MetricId failure_id(Metric metric) noexcept {
  return static_cast<telemetry::MetricId>(id(metric) + kFailureOffset);
}

inline constexpr std::string_view metric_name(telemetry::MetricId metric_id) noexcept {
  switch (metric_id) {
    case id(Metric::kDeposit):
      return "deposit";
    case id(Metric::kMint):
      return "mint";
    case id(Metric::kRedeem):
      return "redeem";
    case id(Metric::kBurn):
      return "burn";
    case id(Metric::kDepositAndMint):
      return "deposit_and_mint";
    case id(Metric::kRedeemAndBurn):
      return "redeem_and_burn";
    case id(Metric::kLiquidate):
      return "liquidate";
    case id(Metric::kRestore):
      return "restore";
    case id(Metric::kReentrancyRejected):
      return "reentrancy_rejected";
    case id(Metric::kCompensationFailed):
      return "compensation_failed";
    case id(Metric::kEventsPublished):
      return "events_published";
    default:
      break;
  }
  if (metric_id > kFailureOffset) {
    return "failures";
  }
  return "unknown";
}

}  // namespace engine
}  // namespace stablecore
