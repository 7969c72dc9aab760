#pragma once

#include <filesystem>
#include <optional>

#include "stablecore/common/types.hpp"
#include "stablecore/ledger/ledger_state.hpp"

namespace stablecore {
namespace snapshot {

struct LedgerSnapshot {
  common::SequenceId sequence{0};
  ledger::LedgerState ledger{};
};

// Holds the newest ledger image in <directory>/ledger.snap, tagged with the
// WAL sequence it covers. persist() writes a sibling file and renames it into
// place, so a crash mid-write leaves the previous image intact.
class Store {
 public:
  explicit Store(const std::filesystem::path& directory);

  void persist(common::SequenceId sequence, const ledger::LedgerState& ledger);

  // Empty when no snapshot was ever taken. Throws std::runtime_error when the
  // file is damaged.
  [[nodiscard]] std::optional<LedgerSnapshot> latest() const;
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace snapshot
}  // namespace stablecore
