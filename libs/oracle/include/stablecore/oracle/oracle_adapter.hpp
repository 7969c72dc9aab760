#pragma once

#include <cstdint>
#include <functional>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/oracle/price_feed.hpp"

namespace stablecore {
namespace oracle {

struct PriceResult {
  common::Status status{common::Status::kOk};
  common::Amount price{0};  // 18-decimal fixed point
};

// Turns raw feed readings into 18-decimal prices. A reading that is flagged
// invalid, non-positive, or older than max_staleness_s yields
// kPriceUnavailable. max_staleness_s == 0 disables the age check.
class OracleAdapter {
 public:
  using Clock = std::function<common::TimestampS()>;

  static constexpr common::TimestampS kDefaultMaxStaleness = 3 * 60 * 60;

  explicit OracleAdapter(PriceFeed& feed,
                         common::TimestampS max_staleness_s = kDefaultMaxStaleness,
                         Clock clock = {});

  [[nodiscard]] PriceResult normalized_price(const FeedRef& ref) const;

  [[nodiscard]] common::TimestampS max_staleness() const noexcept { return max_staleness_s_; }

 private:
  PriceFeed& feed_;
  common::TimestampS max_staleness_s_;
  Clock clock_;
};

}  // namespace oracle
}  // namespace stablecore
