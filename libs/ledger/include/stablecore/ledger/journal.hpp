#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/ledger/events.hpp"
#include "stablecore/ledger/ledger_state.hpp"

namespace stablecore {
namespace ledger {

// Unit of work for one public engine operation.
//
// Ledger mutations go through the journal, which remembers the prior balance
// of every touched entry and whether the entry existed at all, so a rolled
// back operation leaves no trace. Events are buffered until commit.
// Collaborator calls are queued with defer() and executed by settle() once
// every in-memory check has passed; each completed call contributes a compensation that rollback()
// runs in reverse order. Destroying an uncommitted journal rolls back.
class Journal {
 public:
  struct Settlement {
    std::function<common::Status()> execute;
    std::function<bool()> compensate;
  };

  explicit Journal(LedgerState& state);
  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;
  Journal(Journal&&) = delete;
  Journal& operator=(Journal&&) = delete;
  ~Journal();

  common::Status credit(common::AccountId account, common::AssetId asset, common::Amount amount);
  common::Status debit(common::AccountId account, common::AssetId asset, common::Amount amount);
  common::Status increase_debt(common::AccountId account, common::Amount amount);
  common::Status decrease_debt(common::AccountId account, common::Amount amount);

  void emit(Event event);
  void defer(Settlement settlement);

  // Runs deferred collaborator calls in order and stops at the first failure.
  [[nodiscard]] common::Status settle();

  // Keeps all mutations and hands back the buffered events for publication.
  std::vector<Event> commit();
  void rollback() noexcept;

  [[nodiscard]] const LedgerState& state() const noexcept { return state_; }
  [[nodiscard]] const std::vector<Event>& pending_events() const noexcept { return events_; }
  [[nodiscard]] std::size_t failed_compensations() const noexcept { return failed_compensations_; }
  [[nodiscard]] bool finished() const noexcept { return finished_; }

 private:
  struct UndoEntry {
    enum class Kind : std::uint8_t { kCollateral, kDebt };
    Kind kind{Kind::kCollateral};
    common::AccountId account{};
    common::AssetId asset{};
    common::Amount previous{0};
    bool entry_existed{true};  // collateral slot, for kCollateral
    bool account_existed{true};
  };

  [[nodiscard]] UndoEntry capture(UndoEntry::Kind kind, common::AccountId account, common::AssetId asset) const;

  LedgerState& state_;
  std::vector<UndoEntry> undo_{};
  std::vector<Event> events_{};
  std::vector<Settlement> deferred_{};
  std::vector<std::function<bool()>> compensations_{};
  std::size_t failed_compensations_{0};
  bool finished_{false};
};

}  // namespace ledger
}  // namespace stablecore
