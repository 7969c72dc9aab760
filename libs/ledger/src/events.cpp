#include "stablecore/ledger/events.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <stdexcept>
#include <type_traits>

namespace stablecore {
namespace ledger {

namespace {

template <typename T>
void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("event decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

}  // namespace

EventKind kind_of(const Event& event) noexcept {
  return std::visit(
      [](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, CollateralDeposited>) {
          return EventKind::kCollateralDeposited;
        } else if constexpr (std::is_same_v<T, CollateralRedeemed>) {
          return EventKind::kCollateralRedeemed;
        } else if constexpr (std::is_same_v<T, DebtMinted>) {
          return EventKind::kDebtMinted;
        } else {
          return EventKind::kDebtBurned;
        }
      },
      event);
}

std::vector<std::byte> encode(const Event& event) {
  std::vector<std::byte> buffer;
  buffer.reserve(1 + 2 * sizeof(common::AccountId) + sizeof(common::Amount) + sizeof(common::AssetId));
  append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(kind_of(event)));

  std::visit(
      [&buffer](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, CollateralDeposited>) {
          append_primitive(buffer, e.account);
          append_primitive(buffer, e.asset);
          append_primitive(buffer, e.amount);
        } else if constexpr (std::is_same_v<T, CollateralRedeemed>) {
          append_primitive(buffer, e.from);
          append_primitive(buffer, e.to);
          append_primitive(buffer, e.amount);
          append_primitive(buffer, e.asset);
        } else if constexpr (std::is_same_v<T, DebtMinted>) {
          append_primitive(buffer, e.account);
          append_primitive(buffer, e.amount);
        } else {
          append_primitive(buffer, e.on_behalf_of);
          append_primitive(buffer, e.payer);
          append_primitive(buffer, e.amount);
        }
      },
      event);
  return buffer;
}

Event decode_event(std::span<const std::byte> data) {
  std::size_t offset = 0;
  const auto kind = static_cast<EventKind>(read_primitive<std::uint8_t>(data, offset));

  switch (kind) {
    case EventKind::kCollateralDeposited: {
      CollateralDeposited e;
      e.account = read_primitive<common::AccountId>(data, offset);
      e.asset = read_primitive<common::AssetId>(data, offset);
      e.amount = read_primitive<common::Amount>(data, offset);
      return e;
    }
    case EventKind::kCollateralRedeemed: {
      CollateralRedeemed e;
      e.from = read_primitive<common::AccountId>(data, offset);
      e.to = read_primitive<common::AccountId>(data, offset);
      e.amount = read_primitive<common::Amount>(data, offset);
      e.asset = read_primitive<common::AssetId>(data, offset);
      return e;
    }
    case EventKind::kDebtMinted: {
      DebtMinted e;
      e.account = read_primitive<common::AccountId>(data, offset);
      e.amount = read_primitive<common::Amount>(data, offset);
      return e;
    }
    case EventKind::kDebtBurned: {
      DebtBurned e;
      e.on_behalf_of = read_primitive<common::AccountId>(data, offset);
      e.payer = read_primitive<common::AccountId>(data, offset);
      e.amount = read_primitive<common::Amount>(data, offset);
      return e;
    }
  }
  throw std::runtime_error("unknown event kind");
}

common::Status apply_event(LedgerState& state, const Event& event) {
  return std::visit(
      [&state](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, CollateralDeposited>) {
          return state.credit(e.account, e.asset, e.amount);
        } else if constexpr (std::is_same_v<T, CollateralRedeemed>) {
          return state.debit(e.from, e.asset, e.amount);
        } else if constexpr (std::is_same_v<T, DebtMinted>) {
          return state.increase_debt(e.account, e.amount);
        } else {
          return state.decrease_debt(e.on_behalf_of, e.amount);
        }
      },
      event);
}

void EventLog::publish(const Event& event) {
  events_.push_back(event);
}

}  // namespace ledger
}  // namespace stablecore
