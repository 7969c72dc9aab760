#include "stablecore/engine/liquidation_engine.hpp"

#include "stablecore/common/fixed_point.hpp"

namespace stablecore {
namespace engine {

using common::Amount;
using common::Status;

std::string_view to_string(LiquidationStage stage) noexcept {
  switch (stage) {
    case LiquidationStage::kEligibility:
      return "Eligibility";
    case LiquidationStage::kComputing:
      return "Computing";
    case LiquidationStage::kSeizing:
      return "Seizing";
    case LiquidationStage::kBurning:
      return "Burning";
    case LiquidationStage::kVerifying:
      return "Verifying";
    case LiquidationStage::kSettling:
      return "Settling";
    case LiquidationStage::kDone:
      return "Done";
  }
  return "Unknown";
}

LiquidationQuote LiquidationEngine::quote(common::AssetId asset, Amount debt_to_cover) const {
  if (debt_to_cover <= 0) {
    return {.status = Status::kInvalidAmount};
  }

  const auto base = valuation_.asset_amount_for_value(asset, debt_to_cover);
  if (!base.ok()) {
    return {.status = base.status};
  }
  const auto bonus = common::mul_div(base.value, health_.parameters().liquidation_bonus, risk::kLiquidationPrecision);
  if (!bonus) {
    return {.status = Status::kArithmeticOverflow};
  }
  const auto total = common::checked_add(base.value, *bonus);
  if (!total) {
    return {.status = Status::kArithmeticOverflow};
  }
  return {.base_amount = base.value, .bonus = *bonus, .total = *total};
}

LiquidationResult LiquidationEngine::liquidate(ledger::Journal& journal,
                                               common::AccountId liquidator,
                                               common::AccountId target,
                                               common::AssetId asset,
                                               Amount debt_to_cover) {
  LiquidationResult result;
  result.stage = LiquidationStage::kEligibility;

  if (debt_to_cover <= 0) {
    result.status = Status::kInvalidAmount;
    return result;
  }
  if (!registry_.contains(asset)) {
    result.status = Status::kUnsupportedAsset;
    return result;
  }

  const auto starting = health_.health_factor(target);
  if (!starting.ok()) {
    result.status = starting.status;
    return result;
  }
  result.starting_health = starting.value;
  if (starting.value > health_.parameters().min_health_factor) {
    result.status = Status::kHealthFactorOk;
    return result;
  }

  result.stage = LiquidationStage::kComputing;
  const LiquidationQuote sizing = quote(asset, debt_to_cover);
  if (!sizing.ok()) {
    result.status = sizing.status;
    return result;
  }
  result.base_amount = sizing.base_amount;
  result.bonus = sizing.bonus;

  // Never a partial seizure: the debit fails if the target holds less.
  result.stage = LiquidationStage::kSeizing;
  const Status seized = positions_.redeem(journal, target, liquidator, asset, sizing.total);
  if (seized != Status::kOk) {
    result.status = seized;
    return result;
  }
  result.collateral_seized = sizing.total;

  result.stage = LiquidationStage::kBurning;
  const Status burned = positions_.burn(journal, target, liquidator, debt_to_cover);
  if (burned != Status::kOk) {
    result.status = burned;
    return result;
  }
  result.debt_covered = debt_to_cover;

  result.stage = LiquidationStage::kVerifying;
  const auto ending = health_.health_factor(target);
  if (!ending.ok()) {
    result.status = ending.status;
    return result;
  }
  result.ending_health = ending.value;
  if (ending.value <= result.starting_health) {
    result.status = Status::kHealthFactorNotImproved;
    return result;
  }

  const auto self_check = health_.assert_solvent(liquidator);
  if (!self_check.ok()) {
    result.status = self_check.status;
    result.health_factor = self_check.health_factor;
    return result;
  }
  result.health_factor = self_check.health_factor;
  return result;
}

}  // namespace engine
}  // namespace stablecore
