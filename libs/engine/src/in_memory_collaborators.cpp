#include "stablecore/engine/in_memory_collaborators.hpp"

#include "stablecore/common/fixed_point.hpp"

namespace stablecore {
namespace engine {

using common::Amount;

bool InMemoryCustody::move(common::AssetId asset, common::AccountId from, common::AccountId to, Amount amount) {
  if (amount <= 0 || from == to) {
    return false;
  }
  Amount& source = balances_[{asset, from}];
  if (source < amount) {
    return false;
  }
  Amount& destination = balances_[{asset, to}];
  auto credited = common::checked_add(destination, amount);
  if (!credited) {
    return false;
  }
  source -= amount;
  destination = *credited;
  return true;
}

bool InMemoryCustody::transfer_in(common::AssetId asset, common::AccountId from, Amount amount) {
  return move(asset, from, vault_, amount);
}

bool InMemoryCustody::transfer_out(common::AssetId asset, common::AccountId to, Amount amount) {
  return move(asset, vault_, to, amount);
}

void InMemoryCustody::fund(common::AssetId asset, common::AccountId holder, Amount amount) {
  balances_[{asset, holder}] += amount;
}

Amount InMemoryCustody::balance_of(common::AssetId asset, common::AccountId holder) const {
  if (auto it = balances_.find({asset, holder}); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

bool InMemoryDebtToken::mint(common::AccountId to, Amount amount) {
  if (amount <= 0) {
    return false;
  }
  auto supply = common::checked_add(total_supply_, amount);
  if (!supply) {
    return false;
  }
  total_supply_ = *supply;
  balances_[to] += amount;
  return true;
}

bool InMemoryDebtToken::transfer_from(common::AccountId from, common::AccountId to, Amount amount) {
  if (amount <= 0 || balance_of(from) < amount) {
    return false;
  }
  balances_[from] -= amount;
  balances_[to] += amount;
  return true;
}

bool InMemoryDebtToken::burn(common::AccountId holder, Amount amount) {
  if (amount <= 0 || balance_of(holder) < amount) {
    return false;
  }
  balances_[holder] -= amount;
  total_supply_ -= amount;
  return true;
}

Amount InMemoryDebtToken::balance_of(common::AccountId holder) const {
  if (auto it = balances_.find(holder); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

}  // namespace engine
}  // namespace stablecore
