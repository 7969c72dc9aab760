#include "stablecore/snapshot/ledger_codec.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <stdexcept>

namespace stablecore {
namespace snapshot {

namespace {

template <typename T>
void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("ledger snapshot decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

common::Amount read_balance(std::span<const std::byte> data, std::size_t& offset) {
  const auto value = read_primitive<common::Amount>(data, offset);
  if (value < 0) {
    throw std::runtime_error("negative balance in ledger snapshot");
  }
  return value;
}

}  // namespace

std::vector<std::byte> encode_ledger(const ledger::LedgerState& state) {
  std::vector<std::byte> buffer;
  const auto& accounts = state.accounts();
  append_primitive(buffer, static_cast<std::uint32_t>(accounts.size()));
  for (const auto& [account, position] : accounts) {
    append_primitive(buffer, account);
    append_primitive(buffer, position.debt);
    append_primitive(buffer, static_cast<std::uint32_t>(position.collateral.size()));
    for (const auto& [asset, amount] : position.collateral) {
      append_primitive(buffer, asset);
      append_primitive(buffer, amount);
    }
  }
  return buffer;
}

ledger::LedgerState decode_ledger(std::span<const std::byte> data) {
  ledger::LedgerState state;
  std::size_t offset = 0;
  const auto account_count = read_primitive<std::uint32_t>(data, offset);
  for (std::uint32_t i = 0; i < account_count; ++i) {
    const auto account = read_primitive<common::AccountId>(data, offset);
    state.set_debt(account, read_balance(data, offset));
    const auto positions = read_primitive<std::uint32_t>(data, offset);
    for (std::uint32_t p = 0; p < positions; ++p) {
      const auto asset = read_primitive<common::AssetId>(data, offset);
      state.set_collateral(account, asset, read_balance(data, offset));
    }
  }
  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes in ledger snapshot");
  }
  return state;
}

}  // namespace snapshot
}  // namespace stablecore
