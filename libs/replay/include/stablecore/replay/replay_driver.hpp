#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>

#include "stablecore/common/types.hpp"
#include "stablecore/ledger/ledger_state.hpp"
#include "stablecore/snapshot/snapshot_store.hpp"
#include "stablecore/wal/wal_writer.hpp"

namespace stablecore {
namespace replay {

// Feeds the latest snapshot, then every WAL record after it, to handlers.
class Driver {
 public:
  using SnapshotHandler = std::function<void(snapshot::LedgerSnapshot&&)>;
  using EventHandler = std::function<void(const wal::Record&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_event_handler(EventHandler handler);
  void execute();
  // Whether the last execute() stopped at a record cut short by a crash.
  [[nodiscard]] bool torn_tail() const noexcept { return torn_tail_; }

 private:
  std::filesystem::path snapshot_directory_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  EventHandler event_handler_{};
  bool torn_tail_{false};
};

struct RecoveryStats {
  common::SequenceId snapshot_sequence{0};
  common::SequenceId last_sequence{0};
  std::size_t events_applied{0};
  bool torn_tail{false};
};

// Rebuilds `state` from the driver's snapshot and WAL. Throws
// std::runtime_error when a record does not decode or does not apply cleanly
// to the state rebuilt so far.
RecoveryStats recover_ledger(Driver& driver, ledger::LedgerState& state);

}  // namespace replay
}  // namespace stablecore
