#pragma once

#include <cstdint>
#include <string_view>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/engine/position_engine.hpp"
#include "stablecore/ledger/journal.hpp"
#include "stablecore/risk/asset_registry.hpp"
#include "stablecore/risk/health_factor.hpp"
#include "stablecore/risk/valuation_engine.hpp"

namespace stablecore {
namespace engine {

enum class LiquidationStage : std::uint8_t {
  kEligibility,
  kComputing,
  kSeizing,
  kBurning,
  kVerifying,
  kSettling,
  kDone,
};

std::string_view to_string(LiquidationStage stage) noexcept;

struct LiquidationQuote {
  common::Status status{common::Status::kOk};
  common::Amount base_amount{0};
  common::Amount bonus{0};
  common::Amount total{0};

  [[nodiscard]] bool ok() const noexcept { return status == common::Status::kOk; }
};

struct LiquidationResult {
  common::Status status{common::Status::kOk};
  LiquidationStage stage{LiquidationStage::kEligibility};  // stage reached, or the one that aborted
  common::Amount starting_health{0};
  common::Amount ending_health{0};
  common::Amount debt_covered{0};
  common::Amount base_amount{0};
  common::Amount bonus{0};
  common::Amount collateral_seized{0};
  common::Amount health_factor{0};  // offending ratio when the liquidator's self-check fails

  [[nodiscard]] bool ok() const noexcept { return status == common::Status::kOk; }
  [[nodiscard]] bool aborted() const noexcept { return !ok(); }
  void settled(common::Status settle_status) noexcept {
    status = settle_status;
    stage = settle_status == common::Status::kOk ? LiquidationStage::kDone : LiquidationStage::kSettling;
  }
};

// Eligibility -> Computing -> Seizing -> Burning -> Verifying, staged into a
// journal. The owning facade settles collaborator calls afterwards and rolls
// the whole journal back on any failure.
class LiquidationEngine {
 public:
  LiquidationEngine(const risk::AssetRegistry& registry,
                    const risk::ValuationEngine& valuation,
                    const risk::HealthFactorEngine& health,
                    PositionEngine& positions)
      : registry_(registry), valuation_(valuation), health_(health), positions_(positions) {}

  // Seizure sizing for covering debt_to_cover with `asset`; no state access.
  [[nodiscard]] LiquidationQuote quote(common::AssetId asset, common::Amount debt_to_cover) const;

  LiquidationResult liquidate(ledger::Journal& journal,
                              common::AccountId liquidator,
                              common::AccountId target,
                              common::AssetId asset,
                              common::Amount debt_to_cover);

 private:
  const risk::AssetRegistry& registry_;
  const risk::ValuationEngine& valuation_;
  const risk::HealthFactorEngine& health_;
  PositionEngine& positions_;
};

}  // namespace engine
}  // namespace stablecore
