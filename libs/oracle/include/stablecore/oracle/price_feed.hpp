#pragma once

#include <cstdint>

#include "stablecore/common/types.hpp"

namespace stablecore {
namespace oracle {

// Raw reading as published by an external feed, in the feed's native decimals.
struct PriceReading {
  std::int64_t answer{0};
  common::TimestampS updated_at{0};
  bool valid{false};
};

// Oracle reference attached to a collateral asset.
struct FeedRef {
  common::FeedId id{0};
  std::uint8_t decimals{8};
};

class PriceFeed {
 public:
  virtual ~PriceFeed() = default;
  virtual PriceReading latest_price(common::FeedId feed) = 0;
};

}  // namespace oracle
}  // namespace stablecore
