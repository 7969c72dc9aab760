#pragma once

#include "stablecore/common/types.hpp"

namespace stablecore {
namespace engine {

// Moves collateral assets between holders and the engine's vault.
class Custody {
 public:
  virtual ~Custody() = default;
  virtual bool transfer_in(common::AssetId asset, common::AccountId from, common::Amount amount) = 0;
  virtual bool transfer_out(common::AssetId asset, common::AccountId to, common::Amount amount) = 0;
};

// The synthetic-value ledger. The engine is its minter; burn() destroys
// tokens the holder (normally the engine account) already owns.
class DebtToken {
 public:
  virtual ~DebtToken() = default;
  virtual bool mint(common::AccountId to, common::Amount amount) = 0;
  virtual bool transfer_from(common::AccountId from, common::AccountId to, common::Amount amount) = 0;
  virtual bool burn(common::AccountId holder, common::Amount amount) = 0;
};

}  // namespace engine
}  // namespace stablecore
