#include "stablecore/ledger/ledger_state.hpp"

#include "stablecore/common/fixed_point.hpp"

namespace stablecore {
namespace ledger {

using common::Amount;
using common::Status;

Status LedgerState::credit(common::AccountId account, common::AssetId asset, Amount amount) {
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }
  Amount& balance = accounts_[account].collateral[asset];
  auto next = common::checked_add(balance, amount);
  if (!next) {
    return Status::kArithmeticOverflow;
  }
  balance = *next;
  return Status::kOk;
}

Status LedgerState::debit(common::AccountId account, common::AssetId asset, Amount amount) {
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }
  if (collateral(account, asset) < amount) {
    return Status::kInsufficientCollateral;
  }
  accounts_[account].collateral[asset] -= amount;
  return Status::kOk;
}

Status LedgerState::increase_debt(common::AccountId account, Amount amount) {
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }
  Amount& debt = accounts_[account].debt;
  auto next = common::checked_add(debt, amount);
  if (!next) {
    return Status::kArithmeticOverflow;
  }
  debt = *next;
  return Status::kOk;
}

Status LedgerState::decrease_debt(common::AccountId account, Amount amount) {
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }
  if (debt(account) < amount) {
    return Status::kBurnExceedsDebt;
  }
  accounts_[account].debt -= amount;
  return Status::kOk;
}

Amount LedgerState::collateral(common::AccountId account, common::AssetId asset) const {
  if (auto it = accounts_.find(account); it != accounts_.end()) {
    if (auto balance = it->second.collateral.find(asset); balance != it->second.collateral.end()) {
      return balance->second;
    }
  }
  return 0;
}

Amount LedgerState::debt(common::AccountId account) const {
  if (auto it = accounts_.find(account); it != accounts_.end()) {
    return it->second.debt;
  }
  return 0;
}

AccountState LedgerState::get(common::AccountId account) const {
  if (auto it = accounts_.find(account); it != accounts_.end()) {
    return it->second;
  }
  return {};
}

std::vector<common::AccountId> LedgerState::account_ids() const {
  std::vector<common::AccountId> ids;
  ids.reserve(accounts_.size());
  for (const auto& [id, state] : accounts_) {
    ids.push_back(id);
  }
  return ids;
}

bool LedgerState::has_account(common::AccountId account) const {
  return accounts_.find(account) != accounts_.end();
}

bool LedgerState::has_collateral(common::AccountId account, common::AssetId asset) const {
  auto it = accounts_.find(account);
  return it != accounts_.end() && it->second.collateral.find(asset) != it->second.collateral.end();
}

void LedgerState::set_collateral(common::AccountId account, common::AssetId asset, Amount amount) {
  accounts_[account].collateral[asset] = amount;
}

void LedgerState::set_debt(common::AccountId account, Amount amount) {
  accounts_[account].debt = amount;
}

void LedgerState::erase_collateral(common::AccountId account, common::AssetId asset) {
  if (auto it = accounts_.find(account); it != accounts_.end()) {
    it->second.collateral.erase(asset);
  }
}

void LedgerState::erase_account(common::AccountId account) {
  accounts_.erase(account);
}

}  // namespace ledger
}  // namespace stablecore
