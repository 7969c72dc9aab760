#pragma once

#include <cstdint>

#include "stablecore/common/types.hpp"
#include "stablecore/engine/collateral_engine.hpp"
#include "stablecore/engine/in_memory_collaborators.hpp"
#include "stablecore/ledger/events.hpp"
#include "stablecore/oracle/static_price_feed.hpp"
#include "stablecore/telemetry/telemetry_sink.hpp"

namespace stablecore::tests {

inline constexpr common::AssetId kWeth = 1;
inline constexpr common::AssetId kWbtc = 2;
inline constexpr common::FeedId kWethFeed = 11;
inline constexpr common::FeedId kWbtcFeed = 12;
inline constexpr common::AccountId kEngineAccount = 9'000;
inline constexpr common::AccountId kAlice = 1'001;
inline constexpr common::AccountId kBob = 1'002;
inline constexpr common::TimestampS kNow = 1'700'000'000;

// Whole tokens or dollars at 18 decimals.
inline constexpr common::Amount units(std::int64_t whole) {
  return static_cast<common::Amount>(whole) * common::kPrecision;
}

// 8-decimal feed answer for a whole-dollar price.
inline constexpr std::int64_t usd8(std::int64_t dollars) {
  return dollars * 100'000'000;
}

// Engine wired to in-memory collaborators, a fixed clock and an event log.
// WETH starts at $2000 and WBTC at $30000.
template <typename CustodyT = engine::InMemoryCustody, typename TokenT = engine::InMemoryDebtToken>
struct BasicHarness {
  oracle::StaticPriceFeed feed;
  CustodyT custody{kEngineAccount};
  TokenT token;
  telemetry::TelemetrySink telemetry;
  ledger::EventLog events;
  engine::CollateralEngine engine;

  BasicHarness()
      : engine({kWeth, kWbtc},
               {oracle::FeedRef{.id = kWethFeed, .decimals = 8}, oracle::FeedRef{.id = kWbtcFeed, .decimals = 8}},
               seeded(feed),
               custody,
               token,
               engine::EngineOptions{.engine_account = kEngineAccount,
                                     .clock = [] { return kNow; },
                                     .telemetry = &telemetry}) {
    engine.add_event_sink(events);
  }

  void set_weth_price(std::int64_t dollars) { feed.set_price(kWethFeed, usd8(dollars), kNow); }

  // Funds the holder's wallet and opens a position in one step.
  engine::OperationResult open(common::AccountId account, common::Amount weth, common::Amount debt) {
    custody.fund(kWeth, account, weth);
    return engine.deposit_and_mint(account, kWeth, weth, debt);
  }

 private:
  static oracle::StaticPriceFeed& seeded(oracle::StaticPriceFeed& price_feed) {
    price_feed.set_price(kWethFeed, usd8(2'000), kNow);
    price_feed.set_price(kWbtcFeed, usd8(30'000), kNow);
    return price_feed;
  }
};

using Harness = BasicHarness<>;

}  // namespace stablecore::tests
