#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/ledger/ledger_state.hpp"

namespace stablecore {
namespace ledger {

enum class EventKind : std::uint8_t {
  kCollateralDeposited = 1,
  kCollateralRedeemed = 2,
  kDebtMinted = 3,
  kDebtBurned = 4,
};

struct CollateralDeposited {
  common::AccountId account{};
  common::AssetId asset{};
  common::Amount amount{0};

  friend bool operator==(const CollateralDeposited&, const CollateralDeposited&) = default;
};

struct CollateralRedeemed {
  common::AccountId from{};
  common::AccountId to{};
  common::Amount amount{0};
  common::AssetId asset{};

  friend bool operator==(const CollateralRedeemed&, const CollateralRedeemed&) = default;
};

struct DebtMinted {
  common::AccountId account{};
  common::Amount amount{0};

  friend bool operator==(const DebtMinted&, const DebtMinted&) = default;
};

struct DebtBurned {
  common::AccountId on_behalf_of{};
  common::AccountId payer{};
  common::Amount amount{0};

  friend bool operator==(const DebtBurned&, const DebtBurned&) = default;
};

using Event = std::variant<CollateralDeposited, CollateralRedeemed, DebtMinted, DebtBurned>;

[[nodiscard]] EventKind kind_of(const Event& event) noexcept;

// Little-endian binary codec: [kind:1][fields...]. decode throws
// std::runtime_error on truncated input or an unknown kind.
std::vector<std::byte> encode(const Event& event);
Event decode_event(std::span<const std::byte> data);

// Re-applies a committed event to a ledger during recovery.
[[nodiscard]] common::Status apply_event(LedgerState& state, const Event& event);

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const Event& event) = 0;
};

// Keeps every published event in memory, in order.
class EventLog : public EventSink {
 public:
  void publish(const Event& event) override;
  [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
  void clear() noexcept { events_.clear(); }

 private:
  std::vector<Event> events_{};
};

}  // namespace ledger
}  // namespace stablecore
