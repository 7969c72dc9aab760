#pragma once

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/ledger/ledger_state.hpp"
#include "stablecore/risk/asset_registry.hpp"
#include "stablecore/risk/valuation_engine.hpp"

namespace stablecore {
namespace risk {

struct SummaryResult {
  common::Status status{common::Status::kOk};
  common::Amount debt{0};
  common::Amount collateral_value{0};

  [[nodiscard]] bool ok() const noexcept { return status == common::Status::kOk; }
};

struct SolvencyResult {
  common::Status status{common::Status::kOk};
  common::Amount health_factor{0};

  [[nodiscard]] bool ok() const noexcept { return status == common::Status::kOk; }
};

// health_factor = (collateral_value * threshold / 100) * PRECISION / debt
// Zero debt reads as kMaxAmount: never liquidatable.
class HealthFactorEngine {
 public:
  HealthFactorEngine(const ledger::LedgerState& ledger, const ValuationEngine& valuation,
                     RiskParameters parameters)
      : ledger_(ledger), valuation_(valuation), parameters_(parameters) {}

  [[nodiscard]] SummaryResult account_summary(common::AccountId account) const;
  [[nodiscard]] AmountResult health_factor(common::AccountId account) const;
  [[nodiscard]] AmountResult health_factor_for(common::Amount debt, common::Amount collateral_value) const;

  // kBreaksHealthFactor when the ratio is strictly below the minimum.
  [[nodiscard]] SolvencyResult assert_solvent(common::AccountId account) const;

  [[nodiscard]] const RiskParameters& parameters() const noexcept { return parameters_; }

 private:
  const ledger::LedgerState& ledger_;
  const ValuationEngine& valuation_;
  RiskParameters parameters_;
};

}  // namespace risk
}  // namespace stablecore
