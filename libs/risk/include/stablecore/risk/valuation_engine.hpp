#pragma once

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/ledger/ledger_state.hpp"
#include "stablecore/oracle/oracle_adapter.hpp"
#include "stablecore/risk/asset_registry.hpp"

namespace stablecore {
namespace risk {

struct AmountResult {
  common::Status status{common::Status::kOk};
  common::Amount value{0};

  [[nodiscard]] bool ok() const noexcept { return status == common::Status::kOk; }
};

// Converts between collateral quantities and normalized value units using
// 18-decimal oracle prices. Multiplication always precedes division.
class ValuationEngine {
 public:
  ValuationEngine(const AssetRegistry& registry, const oracle::OracleAdapter& oracle)
      : registry_(registry), oracle_(oracle) {}

  // price * amount / PRECISION
  [[nodiscard]] AmountResult usd_value(common::AssetId asset, common::Amount amount) const;

  // usd * PRECISION / price
  [[nodiscard]] AmountResult asset_amount_for_value(common::AssetId asset, common::Amount usd_amount) const;

  // Sum of usd_value over every registered asset.
  [[nodiscard]] AmountResult total_collateral_value(const ledger::LedgerState& ledger,
                                                    common::AccountId account) const;

  [[nodiscard]] AmountResult price_of(common::AssetId asset) const;

 private:
  const AssetRegistry& registry_;
  const oracle::OracleAdapter& oracle_;
};

}  // namespace risk
}  // namespace stablecore
