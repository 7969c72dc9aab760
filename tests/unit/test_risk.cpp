#include "test_risk.hpp"

#include <cassert>

#include "stablecore/common/status.hpp"
#include "stablecore/ledger/ledger_state.hpp"
#include "stablecore/oracle/oracle_adapter.hpp"
#include "stablecore/oracle/static_price_feed.hpp"
#include "stablecore/risk/asset_registry.hpp"
#include "stablecore/risk/health_factor.hpp"
#include "stablecore/risk/valuation_engine.hpp"
#include "test_support.hpp"

namespace stablecore::tests {

using common::Status;

namespace {

risk::AssetRegistry make_registry() {
  return risk::AssetRegistry({kWeth, kWbtc}, {{.id = kWethFeed, .decimals = 8}, {.id = kWbtcFeed, .decimals = 8}});
}

}  // namespace

void test_asset_registry() {
  const auto registry = make_registry();
  assert(registry.size() == 2);
  assert(registry.contains(kWeth));
  assert(!registry.contains(77));
  assert(registry.feed_for(kWbtc)->id == kWbtcFeed);
  assert(!registry.feed_for(77).has_value());
  assert(registry.assets().front() == kWeth);

  bool threw = false;
  try {
    risk::AssetRegistry mismatched({kWeth, kWbtc}, {{.id = kWethFeed, .decimals = 8}});
  } catch (const common::EngineError& e) {
    threw = e.status() == Status::kConfigurationMismatch;
  }
  assert(threw);

  threw = false;
  try {
    risk::AssetRegistry duplicated({kWeth, kWeth}, {{.id = kWethFeed, .decimals = 8}, {.id = kWbtcFeed, .decimals = 8}});
  } catch (const common::EngineError& e) {
    threw = e.status() == Status::kConfigurationMismatch;
  }
  assert(threw);
}

void test_valuation() {
  const auto registry = make_registry();
  oracle::StaticPriceFeed feed;
  feed.set_price(kWethFeed, usd8(2'000), kNow);
  feed.set_price(kWbtcFeed, usd8(30'000), kNow);
  oracle::OracleAdapter adapter(feed, 0);
  risk::ValuationEngine valuation(registry, adapter);

  auto value = valuation.usd_value(kWeth, units(15) / 10);
  assert(value.ok());
  assert(value.value == units(3'000));
  assert(valuation.usd_value(kWeth, 0).value == 0);
  assert(valuation.usd_value(77, units(1)).status == Status::kUnsupportedAsset);
  assert(valuation.usd_value(kWeth, -1).status == Status::kInvalidAmount);

  auto amount = valuation.asset_amount_for_value(kWeth, units(100));
  assert(amount.ok());
  assert(amount.value == units(5) / 100);
  // Floors: $1 of WBTC at $30000.
  assert(valuation.asset_amount_for_value(kWbtc, units(1)).value == 33'333'333'333'333);

  ledger::LedgerState ledger;
  assert(valuation.total_collateral_value(ledger, kAlice).value == 0);
  assert(ledger.credit(kAlice, kWeth, units(1)) == Status::kOk);
  assert(ledger.credit(kAlice, kWbtc, units(1) / 10) == Status::kOk);
  auto total = valuation.total_collateral_value(ledger, kAlice);
  assert(total.ok());
  assert(total.value == units(5'000));

  // Every registered asset is valued, held or not.
  feed.invalidate(kWbtcFeed);
  ledger::LedgerState weth_only;
  assert(weth_only.credit(kBob, kWeth, units(1)) == Status::kOk);
  assert(valuation.total_collateral_value(weth_only, kBob).status == Status::kPriceUnavailable);
}

void test_valuation_round_trip() {
  const auto registry = make_registry();
  oracle::StaticPriceFeed feed;
  oracle::OracleAdapter adapter(feed, 0);
  risk::ValuationEngine valuation(registry, adapter);
  feed.set_price(kWbtcFeed, usd8(30'000), kNow);

  // 8-decimal answers whose scaled price does not divide evenly.
  const std::int64_t answers[] = {199'999'999'999, 3'000'012'345'678, 100'000'001, 123'456'789'012};
  const common::Amount amounts[] = {
      1,
      7,
      999'999'999'999'999'999,
      units(1),
      units(1) / 3,
      units(12'345) + 6'789,
      common::kMaxAmount / 30'001,
      common::kMaxAmount / 30'001 - 1,
  };

  for (const auto answer : answers) {
    feed.set_price(kWethFeed, answer, kNow);
    for (const auto amount : amounts) {
      const auto value = valuation.usd_value(kWeth, amount);
      assert(value.ok());
      const auto back = valuation.asset_amount_for_value(kWeth, value.value);
      assert(back.ok());
      // Both legs floor, so the amount never grows and loses at most one unit.
      assert(back.value <= amount);
      assert(amount - back.value <= 1);
    }
    assert(valuation.usd_value(kWeth, common::kMaxAmount).status == Status::kArithmeticOverflow);
  }
}

void test_health_factor() {
  const auto registry = make_registry();
  oracle::StaticPriceFeed feed;
  feed.set_price(kWethFeed, usd8(2'000), kNow);
  feed.set_price(kWbtcFeed, usd8(30'000), kNow);
  oracle::OracleAdapter adapter(feed, 0);
  risk::ValuationEngine valuation(registry, adapter);
  ledger::LedgerState ledger;
  risk::HealthFactorEngine health(ledger, valuation, risk::RiskParameters{});

  // $1000 of debt against $2000 of collateral at a 50% threshold.
  auto ratio = health.health_factor_for(units(1'000), units(2'000));
  assert(ratio.ok());
  assert(ratio.value == common::kPrecision);
  assert(health.health_factor_for(units(100), units(1'000)).value == 5 * common::kPrecision);
  assert(health.health_factor_for(0, 0).value == common::kMaxAmount);
  assert(health.health_factor_for(-1, 0).status == Status::kInvalidAmount);

  // No debt: maximal and the oracle is not consulted.
  feed.invalidate(kWethFeed);
  assert(health.health_factor(kAlice).value == common::kMaxAmount);
  assert(health.assert_solvent(kAlice).ok());

  feed.set_price(kWethFeed, usd8(2'000), kNow);
  assert(ledger.credit(kAlice, kWeth, units(1)) == Status::kOk);
  assert(ledger.increase_debt(kAlice, units(1'000)) == Status::kOk);
  const auto summary = health.account_summary(kAlice);
  assert(summary.ok());
  assert(summary.debt == units(1'000));
  assert(summary.collateral_value == units(2'000));
  assert(health.health_factor(kAlice).value == common::kPrecision);
  assert(health.assert_solvent(kAlice).ok());

  assert(ledger.increase_debt(kAlice, 1) == Status::kOk);
  const auto breach = health.assert_solvent(kAlice);
  assert(breach.status == Status::kBreaksHealthFactor);
  assert(breach.health_factor < common::kPrecision);

  feed.invalidate(kWethFeed);
  assert(health.health_factor(kAlice).status == Status::kPriceUnavailable);
  assert(health.assert_solvent(kAlice).status == Status::kPriceUnavailable);

  risk::HealthFactorEngine strict(ledger, valuation, {.liquidation_threshold = 80, .liquidation_bonus = 5,
                                                      .min_health_factor = 2 * common::kPrecision});
  assert(strict.health_factor_for(units(100), units(1'000)).value == 8 * common::kPrecision);
  assert(strict.parameters().min_health_factor == 2 * common::kPrecision);
}

}  // namespace stablecore::tests
