#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "stablecore/common/types.hpp"
#include "stablecore/engine/collateral_engine.hpp"
#include "stablecore/engine/position_engine.hpp"

namespace stablecore {
namespace engine {

enum class Operation : std::uint8_t {
  kDeposit = 1,
  kMint = 2,
  kRedeem = 3,
  kBurn = 4,
  kDepositAndMint = 5,
  kRedeemAndBurn = 6,
  kLiquidate = 7,
};

std::string_view to_string(Operation op) noexcept;

// One externally submitted mutation. `account` is the acting identity
// (the liquidator for kLiquidate); `target` is only read by kLiquidate.
// `secondary_amount` carries the mint or burn leg of the combined operations.
struct OperationRequest {
  Operation op{Operation::kDeposit};
  common::AccountId account{0};
  common::AccountId target{0};
  common::AssetId asset{0};
  common::Amount amount{0};
  common::Amount secondary_amount{0};
  std::uint64_t nonce{0};

  friend bool operator==(const OperationRequest&, const OperationRequest&) = default;
};

// Canonical signing bytes:
// [op:1][account:8][target:8][asset:4][amount:16][secondary:16][nonce:8].
std::vector<std::byte> encode(const OperationRequest& request);
// Throws std::runtime_error on short input or an unknown operation.
OperationRequest decode_request(std::span<const std::byte> data);

// Text form used by the daemon script, amounts in base units:
//   deposit <account> <asset> <amount>
//   mint <account> <amount>
//   deposit_and_mint <account> <asset> <collateral> <mint>
//   redeem <account> <asset> <amount>
//   burn <account> <amount>
//   redeem_and_burn <account> <asset> <collateral> <burn>
//   liquidate <liquidator> <target> <asset> <debt>
[[nodiscard]] std::optional<OperationRequest> parse_command(std::string_view line);

// Routes a request to the matching engine operation. Liquidation results are
// folded into an OperationResult carrying the liquidator's health factor.
OperationResult dispatch(CollateralEngine& engine, const OperationRequest& request);

}  // namespace engine
}  // namespace stablecore
