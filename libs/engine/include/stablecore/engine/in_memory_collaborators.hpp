#pragma once

#include <map>
#include <utility>

#include "stablecore/common/types.hpp"
#include "stablecore/engine/collaborators.hpp"

namespace stablecore {
namespace engine {

// Simulated custody: holder wallets per asset plus the engine vault. Transfers
// fail instead of overdrawing either side, and the vault cannot pay itself.
class InMemoryCustody : public Custody {
 public:
  explicit InMemoryCustody(common::AccountId vault_account) : vault_(vault_account) {}

  bool transfer_in(common::AssetId asset, common::AccountId from, common::Amount amount) override;
  bool transfer_out(common::AssetId asset, common::AccountId to, common::Amount amount) override;

  void fund(common::AssetId asset, common::AccountId holder, common::Amount amount);
  [[nodiscard]] common::Amount balance_of(common::AssetId asset, common::AccountId holder) const;
  [[nodiscard]] common::AccountId vault() const noexcept { return vault_; }

 private:
  bool move(common::AssetId asset, common::AccountId from, common::AccountId to, common::Amount amount);

  common::AccountId vault_;
  std::map<std::pair<common::AssetId, common::AccountId>, common::Amount> balances_{};
};

// Simulated synthetic-value token with a tracked total supply.
class InMemoryDebtToken : public DebtToken {
 public:
  bool mint(common::AccountId to, common::Amount amount) override;
  bool transfer_from(common::AccountId from, common::AccountId to, common::Amount amount) override;
  bool burn(common::AccountId holder, common::Amount amount) override;

  [[nodiscard]] common::Amount balance_of(common::AccountId holder) const;
  [[nodiscard]] common::Amount total_supply() const noexcept { return total_supply_; }

 private:
  std::map<common::AccountId, common::Amount> balances_{};
  common::Amount total_supply_{0};
};

}  // namespace engine
}  // namespace stablecore
