#include "stablecore/engine/position_engine.hpp"

namespace stablecore {
namespace engine {

using common::Amount;
using common::Status;

Status PositionEngine::deposit(ledger::Journal& journal, common::AccountId account, common::AssetId asset,
                               Amount amount) {
  if (account == engine_account_) {
    return Status::kReservedAccount;
  }
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }
  if (!registry_.contains(asset)) {
    return Status::kUnsupportedAsset;
  }

  const Status credited = journal.credit(account, asset, amount);
  if (credited != Status::kOk) {
    return credited;
  }
  journal.emit(ledger::CollateralDeposited{.account = account, .asset = asset, .amount = amount});

  journal.defer({
      .execute = [this, account, asset, amount] {
        return custody_.transfer_in(asset, account, amount) ? Status::kOk : Status::kTransferFailed;
      },
      .compensate = [this, account, asset, amount] { return custody_.transfer_out(asset, account, amount); },
  });
  return Status::kOk;
}

OperationResult PositionEngine::mint(ledger::Journal& journal, common::AccountId account, Amount amount) {
  if (account == engine_account_) {
    return {.status = Status::kReservedAccount};
  }
  if (amount <= 0) {
    return {.status = Status::kInvalidAmount};
  }

  const Status increased = journal.increase_debt(account, amount);
  if (increased != Status::kOk) {
    return {.status = increased};
  }
  journal.emit(ledger::DebtMinted{.account = account, .amount = amount});

  const auto solvency = health_.assert_solvent(account);
  if (!solvency.ok()) {
    return {.status = solvency.status, .health_factor = solvency.health_factor};
  }

  journal.defer({
      .execute = [this, account, amount] {
        return debt_token_.mint(account, amount) ? Status::kOk : Status::kMintFailed;
      },
      .compensate =
          [this, account, amount] {
            return debt_token_.transfer_from(account, engine_account_, amount) &&
                   debt_token_.burn(engine_account_, amount);
          },
  });
  return {.health_factor = solvency.health_factor};
}

Status PositionEngine::redeem(ledger::Journal& journal, common::AccountId from, common::AccountId to,
                              common::AssetId asset, Amount amount) {
  if (from == engine_account_ || to == engine_account_) {
    return Status::kReservedAccount;
  }
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }
  if (!registry_.contains(asset)) {
    return Status::kUnsupportedAsset;
  }

  const Status debited = journal.debit(from, asset, amount);
  if (debited != Status::kOk) {
    return debited;
  }
  journal.emit(ledger::CollateralRedeemed{.from = from, .to = to, .amount = amount, .asset = asset});

  journal.defer({
      .execute = [this, to, asset, amount] {
        return custody_.transfer_out(asset, to, amount) ? Status::kOk : Status::kTransferFailed;
      },
      .compensate = [this, to, asset, amount] { return custody_.transfer_in(asset, to, amount); },
  });
  return Status::kOk;
}

Status PositionEngine::burn(ledger::Journal& journal, common::AccountId on_behalf_of, common::AccountId payer,
                            Amount amount) {
  if (on_behalf_of == engine_account_ || payer == engine_account_) {
    return Status::kReservedAccount;
  }
  if (amount <= 0) {
    return Status::kInvalidAmount;
  }

  const Status decreased = journal.decrease_debt(on_behalf_of, amount);
  if (decreased != Status::kOk) {
    return decreased;
  }
  journal.emit(ledger::DebtBurned{.on_behalf_of = on_behalf_of, .payer = payer, .amount = amount});

  journal.defer({
      .execute = [this, payer, amount] {
        return debt_token_.transfer_from(payer, engine_account_, amount) ? Status::kOk : Status::kBurnFailed;
      },
      .compensate = [this, payer, amount] { return debt_token_.transfer_from(engine_account_, payer, amount); },
  });
  journal.defer({
      .execute = [this, amount] {
        return debt_token_.burn(engine_account_, amount) ? Status::kOk : Status::kBurnFailed;
      },
      .compensate = [this, amount] { return debt_token_.mint(engine_account_, amount); },
  });
  return Status::kOk;
}

}  // namespace engine
}  // namespace stablecore
