#include "stablecore/risk/health_factor.hpp"

#include "stablecore/common/fixed_point.hpp"

namespace stablecore {
namespace risk {

using common::Amount;
using common::Status;

SummaryResult HealthFactorEngine::account_summary(common::AccountId account) const {
  SummaryResult summary;
  summary.debt = ledger_.debt(account);
  const AmountResult value = valuation_.total_collateral_value(ledger_, account);
  summary.status = value.status;
  summary.collateral_value = value.value;
  return summary;
}

AmountResult HealthFactorEngine::health_factor_for(Amount debt, Amount collateral_value) const {
  if (debt < 0 || collateral_value < 0) {
    return {.status = Status::kInvalidAmount};
  }
  if (debt == 0) {
    return {.value = common::kMaxAmount};
  }

  const auto adjusted = common::mul_div(collateral_value, parameters_.liquidation_threshold, kLiquidationPrecision);
  if (!adjusted) {
    return {.status = Status::kArithmeticOverflow};
  }
  const auto ratio = common::mul_div(*adjusted, common::kPrecision, debt);
  if (!ratio) {
    return {.status = Status::kArithmeticOverflow};
  }
  return {.value = *ratio};
}

AmountResult HealthFactorEngine::health_factor(common::AccountId account) const {
  const Amount debt = ledger_.debt(account);
  if (debt == 0) {
    return {.value = common::kMaxAmount};
  }
  const SummaryResult summary = account_summary(account);
  if (!summary.ok()) {
    return {.status = summary.status};
  }
  return health_factor_for(summary.debt, summary.collateral_value);
}

SolvencyResult HealthFactorEngine::assert_solvent(common::AccountId account) const {
  const AmountResult ratio = health_factor(account);
  if (!ratio.ok()) {
    return {.status = ratio.status};
  }
  if (ratio.value < parameters_.min_health_factor) {
    return {.status = Status::kBreaksHealthFactor, .health_factor = ratio.value};
  }
  return {.health_factor = ratio.value};
}

}  // namespace risk
}  // namespace stablecore
