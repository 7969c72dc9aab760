#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace stablecore {
namespace common {

enum class Status : std::uint8_t {
  kOk,
  kInvalidAmount,
  kUnsupportedAsset,
  kInsufficientCollateral,
  kBurnExceedsDebt,
  kTransferFailed,
  kMintFailed,
  kBurnFailed,
  kBreaksHealthFactor,
  kHealthFactorOk,
  kHealthFactorNotImproved,
  kPriceUnavailable,
  kConfigurationMismatch,
  kReentrancy,
  kArithmeticOverflow,
  kReservedAccount,
};

inline constexpr std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "Ok";
    case Status::kInvalidAmount:
      return "InvalidAmount";
    case Status::kUnsupportedAsset:
      return "UnsupportedAsset";
    case Status::kInsufficientCollateral:
      return "InsufficientCollateral";
    case Status::kBurnExceedsDebt:
      return "BurnExceedsDebt";
    case Status::kTransferFailed:
      return "TransferFailed";
    case Status::kMintFailed:
      return "MintFailed";
    case Status::kBurnFailed:
      return "BurnFailed";
    case Status::kBreaksHealthFactor:
      return "BreaksHealthFactor";
    case Status::kHealthFactorOk:
      return "HealthFactorOk";
    case Status::kHealthFactorNotImproved:
      return "HealthFactorNotImproved";
    case Status::kPriceUnavailable:
      return "PriceUnavailable";
    case Status::kConfigurationMismatch:
      return "ConfigurationMismatch";
    case Status::kReentrancy:
      return "Reentrancy";
    case Status::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case Status::kReservedAccount:
      return "ReservedAccount";
  }
  return "Unknown";
}

// Thrown only where a result struct cannot be returned, i.e. from constructors.
class EngineError : public std::runtime_error {
 public:
  EngineError(Status status, const std::string& message)
      : std::runtime_error(std::string(to_string(status)) + ": " + message), status_(status) {}

  [[nodiscard]] Status status() const noexcept { return status_; }

 private:
  Status status_;
};

}  // namespace common
}  // namespace stablecore
