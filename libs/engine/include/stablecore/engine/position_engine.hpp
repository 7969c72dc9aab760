#pragma once

#include <cstdint>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/engine/collaborators.hpp"
#include "stablecore/ledger/journal.hpp"
#include "stablecore/risk/asset_registry.hpp"
#include "stablecore/risk/health_factor.hpp"

namespace stablecore {
namespace engine {

struct OperationResult {
  common::Status status{common::Status::kOk};
  // Ratio that failed the check for kBreaksHealthFactor, otherwise the
  // account's ratio after the operation when it was evaluated.
  common::Amount health_factor{0};

  [[nodiscard]] bool ok() const noexcept { return status == common::Status::kOk; }
  void settled(common::Status settle_status) noexcept { status = settle_status; }
};

// Stages deposit, mint, redeem and burn into a journal. Ledger mutations and
// events are applied immediately; collaborator calls are deferred to the
// journal's settle step. Callers own the guard and the final solvency check
// except for mint, which checks before its collaborator call is queued.
// The engine account holds the custody vault and burns tokens, so it is
// refused (kReservedAccount) as any party to a position operation.
class PositionEngine {
 public:
  PositionEngine(const risk::AssetRegistry& registry,
                 const risk::HealthFactorEngine& health,
                 Custody& custody,
                 DebtToken& debt_token,
                 common::AccountId engine_account)
      : registry_(registry),
        health_(health),
        custody_(custody),
        debt_token_(debt_token),
        engine_account_(engine_account) {}

  common::Status deposit(ledger::Journal& journal, common::AccountId account, common::AssetId asset,
                         common::Amount amount);

  OperationResult mint(ledger::Journal& journal, common::AccountId account, common::Amount amount);

  // Collateral leaves `from` and is delivered to `to`.
  common::Status redeem(ledger::Journal& journal, common::AccountId from, common::AccountId to,
                        common::AssetId asset, common::Amount amount);

  // Debt of `on_behalf_of` is discharged with tokens pulled from `payer`.
  common::Status burn(ledger::Journal& journal, common::AccountId on_behalf_of, common::AccountId payer,
                      common::Amount amount);

  [[nodiscard]] common::AccountId engine_account() const noexcept { return engine_account_; }

 private:
  const risk::AssetRegistry& registry_;
  const risk::HealthFactorEngine& health_;
  Custody& custody_;
  DebtToken& debt_token_;
  common::AccountId engine_account_;
};

}  // namespace engine
}  // namespace stablecore
