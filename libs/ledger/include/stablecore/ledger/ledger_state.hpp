#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"

namespace stablecore {
namespace ledger {

struct AccountState {
  std::map<common::AssetId, common::Amount> collateral{};
  common::Amount debt{0};

  friend bool operator==(const AccountState&, const AccountState&) = default;
};

// Per-account collateral and debt balances. Pure bookkeeping: no prices, no
// solvency rules. Every subtraction is checked and fails instead of wrapping.
class LedgerState {
 public:
  common::Status credit(common::AccountId account, common::AssetId asset, common::Amount amount);
  common::Status debit(common::AccountId account, common::AssetId asset, common::Amount amount);
  common::Status increase_debt(common::AccountId account, common::Amount amount);
  common::Status decrease_debt(common::AccountId account, common::Amount amount);

  [[nodiscard]] common::Amount collateral(common::AccountId account, common::AssetId asset) const;
  [[nodiscard]] common::Amount debt(common::AccountId account) const;
  [[nodiscard]] AccountState get(common::AccountId account) const;
  [[nodiscard]] std::vector<common::AccountId> account_ids() const;
  [[nodiscard]] const std::map<common::AccountId, AccountState>& accounts() const noexcept { return accounts_; }

  [[nodiscard]] bool has_account(common::AccountId account) const;
  [[nodiscard]] bool has_collateral(common::AccountId account, common::AssetId asset) const;

  // Unconditional writes used by journal rollback and snapshot decoding.
  void set_collateral(common::AccountId account, common::AssetId asset, common::Amount amount);
  void set_debt(common::AccountId account, common::Amount amount);
  void erase_collateral(common::AccountId account, common::AssetId asset);
  void erase_account(common::AccountId account);

  friend bool operator==(const LedgerState&, const LedgerState&) = default;

 private:
  std::map<common::AccountId, AccountState> accounts_{};
};

}  // namespace ledger
}  // namespace stablecore
