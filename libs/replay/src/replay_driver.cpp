#include "stablecore/replay/replay_driver.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "stablecore/ledger/events.hpp"

namespace stablecore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_directory_ = std::move(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

void Driver::execute() {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }

  common::SequenceId resume_from{1};
  torn_tail_ = false;

  if (!snapshot_directory_.empty()) {
    const snapshot::Store snapshots(snapshot_directory_);
    if (auto snap = snapshots.latest()) {
      resume_from = snap->sequence + 1;
      if (snapshot_handler_) {
        snapshot_handler_(std::move(*snap));
      }
    }
  }

  if (!std::filesystem::exists(wal_path_)) {
    return;
  }

  wal::Reader reader(wal_path_);
  reader.seek_sequence(resume_from);
  wal::Record record;
  while (reader.next(record)) {
    event_handler_(record);
  }
  torn_tail_ = reader.torn_tail();
}

RecoveryStats recover_ledger(Driver& driver, ledger::LedgerState& state) {
  RecoveryStats stats;
  ledger::LedgerState rebuilt;

  driver.set_snapshot_handler([&](snapshot::LedgerSnapshot&& snap) {
    rebuilt = std::move(snap.ledger);
    stats.snapshot_sequence = snap.sequence;
    stats.last_sequence = snap.sequence;
  });
  driver.set_event_handler([&](const wal::Record& record) {
    const auto event = ledger::decode_event(record.payload);
    const auto status = ledger::apply_event(rebuilt, event);
    if (status != common::Status::kOk) {
      throw std::runtime_error("replay of WAL sequence " + std::to_string(record.header.sequence) +
                               " failed: " + std::string(common::to_string(status)));
    }
    stats.last_sequence = record.header.sequence;
    ++stats.events_applied;
  });

  driver.execute();
  stats.torn_tail = driver.torn_tail();
  state = std::move(rebuilt);
  return stats;
}

}  // namespace replay
}  // namespace stablecore
