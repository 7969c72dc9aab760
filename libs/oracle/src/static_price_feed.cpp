#include "stablecore/oracle/static_price_feed.hpp"

namespace stablecore {
namespace oracle {

PriceReading StaticPriceFeed::latest_price(common::FeedId feed) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = readings_.find(feed);
  if (it == readings_.end()) {
    return {};
  }
  return it->second;
}

void StaticPriceFeed::set_price(common::FeedId feed, std::int64_t answer, common::TimestampS updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  readings_[feed] = PriceReading{.answer = answer, .updated_at = updated_at, .valid = true};
}

void StaticPriceFeed::invalidate(common::FeedId feed) {
  std::lock_guard<std::mutex> lock(mutex_);
  readings_[feed].valid = false;
}

std::size_t StaticPriceFeed::feed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return readings_.size();
}

}  // namespace oracle
}  // namespace stablecore
