#include "test_liquidation.hpp"

#include <cassert>
#include <variant>

#include "stablecore/engine/liquidation_engine.hpp"
#include "stablecore/engine/metrics.hpp"
#include "test_support.hpp"

namespace stablecore::tests {

using common::Status;
using engine::LiquidationStage;

namespace {

constexpr common::AccountId kKeeper = 2'001;

// Alice: 1 WETH against 1000 of debt at $2000 (ratio exactly 1.0).
// Keeper: 10 WETH against 1000 of debt, tokens in hand to cover.
void open_positions(Harness& h) {
  assert(h.open(kAlice, units(1), units(1'000)).ok());
  assert(h.open(kKeeper, units(10), units(1'000)).ok());
}

}  // namespace

void test_liquidation_quote() {
  Harness h;
  h.set_weth_price(1'000);

  const auto quote = h.engine.quote_liquidation(kWeth, units(500));
  assert(quote.ok());
  assert(quote.base_amount == units(1) / 2);
  assert(quote.bonus == units(1) / 20);
  assert(quote.total == units(11) / 20);

  assert(h.engine.quote_liquidation(kWeth, 0).status == Status::kInvalidAmount);
  assert(h.engine.quote_liquidation(77, units(1)).status == Status::kUnsupportedAsset);

  assert(engine::to_string(LiquidationStage::kSeizing) == "Seizing");
  assert(engine::to_string(LiquidationStage::kDone) == "Done");
}

void test_liquidation_partial_and_full() {
  Harness h;
  open_positions(h);
  h.set_weth_price(1'800);
  assert(h.engine.health_factor(kAlice).value == common::kPrecision * 9 / 10);

  auto partial = h.engine.liquidate(kKeeper, kAlice, kWeth, units(500));
  assert(partial.ok());
  assert(partial.stage == LiquidationStage::kDone);
  assert(partial.starting_health == common::kPrecision * 9 / 10);
  assert(partial.base_amount == 277'777'777'777'777'777);
  assert(partial.bonus == 27'777'777'777'777'777);
  assert(partial.collateral_seized == 305'555'555'555'555'554);
  assert(partial.debt_covered == units(500));
  assert(partial.ending_health == 1'250'000'000'000'000'002);
  assert(partial.health_factor == 9 * common::kPrecision);

  assert(h.engine.debt_of(kAlice) == units(500));
  assert(h.engine.collateral_balance(kAlice, kWeth) == units(1) - 305'555'555'555'555'554);
  // The keeper's own position is untouched; seized collateral is paid out.
  assert(h.engine.collateral_balance(kKeeper, kWeth) == units(10));
  assert(h.engine.debt_of(kKeeper) == units(1'000));
  assert(h.custody.balance_of(kWeth, kKeeper) == 305'555'555'555'555'554);
  assert(h.token.balance_of(kKeeper) == units(500));
  assert(h.token.total_supply() == units(1'500));

  const auto& log = h.events.events();
  const auto& seized = std::get<ledger::CollateralRedeemed>(log[log.size() - 2]);
  assert(seized.from == kAlice);
  assert(seized.to == kKeeper);
  assert(seized.amount == 305'555'555'555'555'554);
  const auto& covered = std::get<ledger::DebtBurned>(log.back());
  assert(covered.on_behalf_of == kAlice);
  assert(covered.payer == kKeeper);

  // Now healthy again.
  auto again = h.engine.liquidate(kKeeper, kAlice, kWeth, units(100));
  assert(again.status == Status::kHealthFactorOk);
  assert(again.stage == LiquidationStage::kEligibility);

  // Price falls further; covering the full debt leaves no debt behind.
  h.set_weth_price(1'000);
  auto full = h.engine.liquidate(kKeeper, kAlice, kWeth, units(500));
  assert(full.ok());
  assert(full.ending_health == common::kMaxAmount);
  assert(h.engine.debt_of(kAlice) == 0);
  assert(h.engine.collateral_balance(kAlice, kWeth) == units(1) - 305'555'555'555'555'554 - units(11) / 20);
  assert(h.token.balance_of(kKeeper) == 0);
  assert(h.telemetry.counter(engine::id(engine::Metric::kLiquidate)) == 3);
  assert(h.telemetry.counter(engine::failure_id(engine::Metric::kLiquidate)) == 1);
}

void test_liquidation_rejections() {
  Harness h;
  open_positions(h);
  const auto events_before = h.events.events().size();

  h.set_weth_price(4'000);
  auto healthy = h.engine.liquidate(kKeeper, kAlice, kWeth, units(100));
  assert(healthy.status == Status::kHealthFactorOk);
  assert(healthy.starting_health == 2 * common::kPrecision);

  // Account without debt is never eligible.
  assert(h.engine.liquidate(kKeeper, kBob, kWeth, units(1)).status == Status::kHealthFactorOk);

  h.set_weth_price(1'000);
  assert(h.engine.liquidate(kKeeper, kAlice, kWeth, 0).status == Status::kInvalidAmount);
  assert(h.engine.liquidate(kKeeper, kAlice, 77, units(1)).status == Status::kUnsupportedAsset);

  // Bonus on top of 1 WETH exceeds what Alice holds.
  auto oversized = h.engine.liquidate(kKeeper, kAlice, kWeth, units(1'000));
  assert(oversized.status == Status::kInsufficientCollateral);
  assert(oversized.stage == LiquidationStage::kSeizing);

  // Seizing 0.55 WETH for 500 of debt leaves the ratio at 0.45.
  auto worse = h.engine.liquidate(kKeeper, kAlice, kWeth, units(500));
  assert(worse.status == Status::kHealthFactorNotImproved);
  assert(worse.stage == LiquidationStage::kVerifying);
  assert(worse.starting_health == common::kPrecision / 2);
  assert(worse.ending_health == common::kPrecision * 45 / 100);

  // Covering more than the outstanding debt.
  h.set_weth_price(1'800);
  auto excess = h.engine.liquidate(kKeeper, kAlice, kWeth, units(1'001));
  assert(excess.status == Status::kBurnExceedsDebt);
  assert(excess.stage == LiquidationStage::kBurning);

  // Nothing moved.
  assert(h.engine.debt_of(kAlice) == units(1'000));
  assert(h.engine.collateral_balance(kAlice, kWeth) == units(1));
  assert(h.token.balance_of(kKeeper) == units(1'000));
  assert(h.custody.balance_of(kWeth, kKeeper) == 0);
  assert(h.events.events().size() == events_before);

  // Keeper without tokens: the burn step fails at settlement.
  assert(h.token.transfer_from(kKeeper, kBob, units(1'000)));
  auto unfunded = h.engine.liquidate(kKeeper, kAlice, kWeth, units(100));
  assert(unfunded.status == Status::kBurnFailed);
  assert(unfunded.stage == LiquidationStage::kSettling);
  assert(h.engine.debt_of(kAlice) == units(1'000));
  assert(h.engine.collateral_balance(kAlice, kWeth) == units(1));
  assert(h.custody.balance_of(kWeth, kKeeper) == 0);
  assert(h.custody.balance_of(kWeth, kEngineAccount) == units(11));
}

void test_liquidator_must_stay_solvent() {
  Harness h;
  assert(h.open(kAlice, units(1), units(1'000)).ok());
  assert(h.open(kKeeper, units(1), units(1'000)).ok());

  h.set_weth_price(1'800);
  auto result = h.engine.liquidate(kKeeper, kAlice, kWeth, units(500));
  assert(result.status == Status::kBreaksHealthFactor);
  assert(result.stage == LiquidationStage::kVerifying);
  assert(result.health_factor == common::kPrecision * 9 / 10);
  assert(result.ending_health > result.starting_health);

  assert(h.engine.debt_of(kAlice) == units(1'000));
  assert(h.engine.collateral_balance(kAlice, kWeth) == units(1));
  assert(h.token.balance_of(kKeeper) == units(1'000));
}

}  // namespace stablecore::tests
