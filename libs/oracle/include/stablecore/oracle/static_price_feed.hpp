#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "stablecore/oracle/price_feed.hpp"

namespace stablecore {
namespace oracle {

// Operator-driven feed for the daemon and tests. Unknown feeds read invalid.
class StaticPriceFeed : public PriceFeed {
 public:
  PriceReading latest_price(common::FeedId feed) override;

  void set_price(common::FeedId feed, std::int64_t answer, common::TimestampS updated_at);
  void invalidate(common::FeedId feed);
  [[nodiscard]] std::size_t feed_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::FeedId, PriceReading> readings_{};
};

}  // namespace oracle
}  // namespace stablecore
