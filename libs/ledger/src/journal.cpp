#include "stablecore/ledger/journal.hpp"

#include <exception>
#include <utility>

namespace stablecore {
namespace ledger {

using common::Amount;
using common::Status;

Journal::Journal(LedgerState& state) : state_(state) {}

Journal::UndoEntry Journal::capture(UndoEntry::Kind kind, common::AccountId account, common::AssetId asset) const {
  UndoEntry entry{.kind = kind, .account = account, .asset = asset};
  entry.account_existed = state_.has_account(account);
  if (kind == UndoEntry::Kind::kCollateral) {
    entry.previous = state_.collateral(account, asset);
    entry.entry_existed = state_.has_collateral(account, asset);
  } else {
    entry.previous = state_.debt(account);
  }
  return entry;
}

Journal::~Journal() {
  if (!finished_) {
    rollback();
  }
}

Status Journal::credit(common::AccountId account, common::AssetId asset, Amount amount) {
  const UndoEntry entry = capture(UndoEntry::Kind::kCollateral, account, asset);
  const Status status = state_.credit(account, asset, amount);
  if (status == Status::kOk) {
    undo_.push_back(entry);
  }
  return status;
}

Status Journal::debit(common::AccountId account, common::AssetId asset, Amount amount) {
  const UndoEntry entry = capture(UndoEntry::Kind::kCollateral, account, asset);
  const Status status = state_.debit(account, asset, amount);
  if (status == Status::kOk) {
    undo_.push_back(entry);
  }
  return status;
}

Status Journal::increase_debt(common::AccountId account, Amount amount) {
  const UndoEntry entry = capture(UndoEntry::Kind::kDebt, account, 0);
  const Status status = state_.increase_debt(account, amount);
  if (status == Status::kOk) {
    undo_.push_back(entry);
  }
  return status;
}

Status Journal::decrease_debt(common::AccountId account, Amount amount) {
  const UndoEntry entry = capture(UndoEntry::Kind::kDebt, account, 0);
  const Status status = state_.decrease_debt(account, amount);
  if (status == Status::kOk) {
    undo_.push_back(entry);
  }
  return status;
}

void Journal::emit(Event event) {
  events_.push_back(std::move(event));
}

void Journal::defer(Settlement settlement) {
  deferred_.push_back(std::move(settlement));
}

Status Journal::settle() {
  auto pending = std::move(deferred_);
  deferred_.clear();

  for (auto& step : pending) {
    const Status status = step.execute();
    if (status != Status::kOk) {
      return status;
    }
    if (step.compensate) {
      compensations_.push_back(std::move(step.compensate));
    }
  }
  return Status::kOk;
}

std::vector<Event> Journal::commit() {
  finished_ = true;
  undo_.clear();
  compensations_.clear();
  deferred_.clear();
  return std::move(events_);
}

void Journal::rollback() noexcept {
  finished_ = true;

  for (auto it = compensations_.rbegin(); it != compensations_.rend(); ++it) {
    try {
      if (!(*it)()) {
        ++failed_compensations_;
      }
    } catch (const std::exception&) {
      ++failed_compensations_;
    }
  }
  compensations_.clear();

  // Newest first, so an account created by this journal is erased by its
  // oldest entry after every later one has been undone.
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    if (!it->account_existed) {
      state_.erase_account(it->account);
    } else if (it->kind == UndoEntry::Kind::kDebt) {
      state_.set_debt(it->account, it->previous);
    } else if (it->entry_existed) {
      state_.set_collateral(it->account, it->asset, it->previous);
    } else {
      state_.erase_collateral(it->account, it->asset);
    }
  }
  undo_.clear();
  events_.clear();
  deferred_.clear();
}

}  // namespace ledger
}  // namespace stablecore
