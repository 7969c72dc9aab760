#include "test_oracle.hpp"

#include <cassert>
#include <limits>

#include "stablecore/oracle/oracle_adapter.hpp"
#include "stablecore/oracle/static_price_feed.hpp"
#include "test_support.hpp"

namespace stablecore::tests {

using common::Status;

void test_oracle_normalization() {
  oracle::StaticPriceFeed feed;
  oracle::OracleAdapter adapter(feed, 0);

  feed.set_price(1, usd8(2'000), kNow);
  auto price = adapter.normalized_price({.id = 1, .decimals = 8});
  assert(price.status == Status::kOk);
  assert(price.price == units(2'000));

  feed.set_price(2, 2'000'000'000'000'000'000, kNow);
  price = adapter.normalized_price({.id = 2, .decimals = 18});
  assert(price.status == Status::kOk);
  assert(price.price == units(2));

  feed.set_price(3, 1'500'000, kNow);
  price = adapter.normalized_price({.id = 3, .decimals = 6});
  assert(price.price == units(3) / 2);

  assert(adapter.normalized_price({.id = 1, .decimals = 19}).status == Status::kPriceUnavailable);
  assert(adapter.normalized_price({.id = 99, .decimals = 8}).status == Status::kPriceUnavailable);

  feed.set_price(4, 0, kNow);
  assert(adapter.normalized_price({.id = 4, .decimals = 8}).status == Status::kPriceUnavailable);
  feed.set_price(4, -5, kNow);
  assert(adapter.normalized_price({.id = 4, .decimals = 8}).status == Status::kPriceUnavailable);

  feed.invalidate(1);
  assert(adapter.normalized_price({.id = 1, .decimals = 8}).status == Status::kPriceUnavailable);
  assert(feed.feed_count() == 4);
}

void test_oracle_staleness() {
  oracle::StaticPriceFeed feed;
  common::TimestampS now = kNow;
  oracle::OracleAdapter adapter(feed, oracle::OracleAdapter::kDefaultMaxStaleness, [&now] { return now; });
  assert(adapter.max_staleness() == 3 * 60 * 60);

  feed.set_price(1, usd8(2'000), kNow);
  const oracle::FeedRef ref{.id = 1, .decimals = 8};
  assert(adapter.normalized_price(ref).status == Status::kOk);

  now = kNow + adapter.max_staleness();
  assert(adapter.normalized_price(ref).status == Status::kOk);

  now = kNow + adapter.max_staleness() + 1;
  assert(adapter.normalized_price(ref).status == Status::kPriceUnavailable);

  feed.set_price(1, usd8(2'100), now);
  const auto refreshed = adapter.normalized_price(ref);
  assert(refreshed.status == Status::kOk);
  assert(refreshed.price == units(2'100));

  // Timestamps ahead of the clock, or far enough back that the age overflows.
  feed.set_price(1, usd8(2'100), now + 1);
  assert(adapter.normalized_price(ref).status == Status::kPriceUnavailable);
  feed.set_price(1, usd8(2'100), std::numeric_limits<common::TimestampS>::min() + 1);
  assert(adapter.normalized_price(ref).status == Status::kPriceUnavailable);
  now = std::numeric_limits<common::TimestampS>::min();
  feed.set_price(1, usd8(2'100), std::numeric_limits<common::TimestampS>::max());
  assert(adapter.normalized_price(ref).status == Status::kPriceUnavailable);

  feed.set_price(1, usd8(2'100), kNow);
  oracle::OracleAdapter lenient(feed, 0, [] { return kNow + 10 * 365 * 24 * 60 * 60; });
  assert(lenient.normalized_price(ref).status == Status::kOk);
}

}  // namespace stablecore::tests
