#include "stablecore/oracle/oracle_adapter.hpp"

#include <utility>

#include "stablecore/common/fixed_point.hpp"
#include "stablecore/common/time_utils.hpp"

namespace stablecore {
namespace oracle {

namespace {
constexpr unsigned kTargetDecimals = 18;
}  // namespace

OracleAdapter::OracleAdapter(PriceFeed& feed, common::TimestampS max_staleness_s, Clock clock)
    : feed_(feed), max_staleness_s_(max_staleness_s), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return common::now_unix_seconds(); };
  }
}

PriceResult OracleAdapter::normalized_price(const FeedRef& ref) const {
  PriceResult result;
  if (ref.decimals > kTargetDecimals) {
    result.status = common::Status::kPriceUnavailable;
    return result;
  }

  const PriceReading reading = feed_.latest_price(ref.id);
  if (!reading.valid || reading.answer <= 0) {
    result.status = common::Status::kPriceUnavailable;
    return result;
  }

  if (max_staleness_s_ > 0) {
    // Readings from the future, or so old the age does not fit, are not fresh.
    common::TimestampS age = 0;
    if (__builtin_sub_overflow(clock_(), reading.updated_at, &age) || age < 0 || age > max_staleness_s_) {
      result.status = common::Status::kPriceUnavailable;
      return result;
    }
  }

  // 8-decimal feeds scale by 1e10.
  const auto adjustment = common::pow10(kTargetDecimals - ref.decimals);
  const auto scaled = adjustment ? common::checked_mul(reading.answer, *adjustment) : std::nullopt;
  if (!scaled) {
    result.status = common::Status::kArithmeticOverflow;
    return result;
  }

  result.price = *scaled;
  return result;
}

}  // namespace oracle
}  // namespace stablecore
