#include "stablecore/engine/operation_request.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <charconv>
#include <stdexcept>
#include <string>

#include "stablecore/common/fixed_point.hpp"

namespace stablecore {
namespace engine {

namespace {

template <typename T>
void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("request decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

std::vector<std::string_view> split_words(std::string_view line) {
  std::vector<std::string_view> words;
  std::size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t') {
      ++pos;
    }
    if (pos > start) {
      words.push_back(line.substr(start, pos - start));
    }
  }
  return words;
}

template <typename T>
std::optional<T> parse_id(std::string_view text) {
  T value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<Operation> parse_operation(std::string_view name) {
  static constexpr std::array<Operation, 7> kAll{
      Operation::kDeposit, Operation::kMint, Operation::kRedeem, Operation::kBurn,
      Operation::kDepositAndMint, Operation::kRedeemAndBurn, Operation::kLiquidate,
  };
  for (auto op : kAll) {
    if (to_string(op) == name) {
      return op;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(Operation op) noexcept {
  switch (op) {
    case Operation::kDeposit:
      return "deposit";
    case Operation::kMint:
      return "mint";
    case Operation::kRedeem:
      return "redeem";
    case Operation::kBurn:
      return "burn";
    case Operation::kDepositAndMint:
      return "deposit_and_mint";
    case Operation::kRedeemAndBurn:
      return "redeem_and_burn";
    case Operation::kLiquidate:
      return "liquidate";
  }
  return "unknown";
}

std::vector<std::byte> encode(const OperationRequest& request) {
  std::vector<std::byte> buffer;
  buffer.reserve(1 + 2 * sizeof(common::AccountId) + sizeof(common::AssetId) + 2 * sizeof(common::Amount) +
                 sizeof(std::uint64_t));
  append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(request.op));
  append_primitive(buffer, request.account);
  append_primitive(buffer, request.target);
  append_primitive(buffer, request.asset);
  append_primitive(buffer, request.amount);
  append_primitive(buffer, request.secondary_amount);
  append_primitive(buffer, request.nonce);
  return buffer;
}

OperationRequest decode_request(std::span<const std::byte> data) {
  std::size_t offset = 0;
  OperationRequest request;
  const auto raw_op = read_primitive<std::uint8_t>(data, offset);
  if (raw_op < static_cast<std::uint8_t>(Operation::kDeposit) ||
      raw_op > static_cast<std::uint8_t>(Operation::kLiquidate)) {
    throw std::runtime_error("unknown operation " + std::to_string(raw_op));
  }
  request.op = static_cast<Operation>(raw_op);
  request.account = read_primitive<common::AccountId>(data, offset);
  request.target = read_primitive<common::AccountId>(data, offset);
  request.asset = read_primitive<common::AssetId>(data, offset);
  request.amount = read_primitive<common::Amount>(data, offset);
  request.secondary_amount = read_primitive<common::Amount>(data, offset);
  request.nonce = read_primitive<std::uint64_t>(data, offset);
  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes after request");
  }
  return request;
}

std::optional<OperationRequest> parse_command(std::string_view line) {
  const auto words = split_words(line);
  if (words.empty()) {
    return std::nullopt;
  }
  const auto op = parse_operation(words[0]);
  if (!op) {
    return std::nullopt;
  }

  OperationRequest request;
  request.op = *op;

  auto account = [&](std::size_t i) { return parse_id<common::AccountId>(words[i]); };
  auto asset = [&](std::size_t i) { return parse_id<common::AssetId>(words[i]); };
  auto amount = [&](std::size_t i) { return common::parse_amount(words[i]); };

  switch (*op) {
    case Operation::kMint:
    case Operation::kBurn: {
      if (words.size() != 3) {
        return std::nullopt;
      }
      auto who = account(1);
      auto value = amount(2);
      if (!who || !value) {
        return std::nullopt;
      }
      request.account = *who;
      request.amount = *value;
      return request;
    }
    case Operation::kDeposit:
    case Operation::kRedeem: {
      if (words.size() != 4) {
        return std::nullopt;
      }
      auto who = account(1);
      auto which = asset(2);
      auto value = amount(3);
      if (!who || !which || !value) {
        return std::nullopt;
      }
      request.account = *who;
      request.asset = *which;
      request.amount = *value;
      return request;
    }
    case Operation::kDepositAndMint:
    case Operation::kRedeemAndBurn: {
      if (words.size() != 5) {
        return std::nullopt;
      }
      auto who = account(1);
      auto which = asset(2);
      auto value = amount(3);
      auto secondary = amount(4);
      if (!who || !which || !value || !secondary) {
        return std::nullopt;
      }
      request.account = *who;
      request.asset = *which;
      request.amount = *value;
      request.secondary_amount = *secondary;
      return request;
    }
    case Operation::kLiquidate: {
      if (words.size() != 5) {
        return std::nullopt;
      }
      auto liquidator = account(1);
      auto target = account(2);
      auto which = asset(3);
      auto value = amount(4);
      if (!liquidator || !target || !which || !value) {
        return std::nullopt;
      }
      request.account = *liquidator;
      request.target = *target;
      request.asset = *which;
      request.amount = *value;
      return request;
    }
  }
  return std::nullopt;
}

OperationResult dispatch(CollateralEngine& engine, const OperationRequest& request) {
  switch (request.op) {
    case Operation::kDeposit:
      return engine.deposit(request.account, request.asset, request.amount);
    case Operation::kMint:
      return engine.mint(request.account, request.amount);
    case Operation::kRedeem:
      return engine.redeem(request.account, request.asset, request.amount);
    case Operation::kBurn:
      return engine.burn(request.account, request.amount);
    case Operation::kDepositAndMint:
      return engine.deposit_and_mint(request.account, request.asset, request.amount, request.secondary_amount);
    case Operation::kRedeemAndBurn:
      return engine.redeem_and_burn(request.account, request.asset, request.amount, request.secondary_amount);
    case Operation::kLiquidate: {
      const auto result = engine.liquidate(request.account, request.target, request.asset, request.amount);
      return {.status = result.status, .health_factor = result.health_factor};
    }
  }
  return {.status = common::Status::kInvalidAmount};
}

}  // namespace engine
}  // namespace stablecore
