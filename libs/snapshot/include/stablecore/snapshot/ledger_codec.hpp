#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "stablecore/ledger/ledger_state.hpp"

namespace stablecore {
namespace snapshot {

// [accounts:4] then per account, ascending by id:
// [id:8][debt:16][positions:4] then per position [asset:4][amount:16].
std::vector<std::byte> encode_ledger(const ledger::LedgerState& state);

// Throws std::runtime_error on truncated input, trailing bytes or negative
// balances.
ledger::LedgerState decode_ledger(std::span<const std::byte> data);

}  // namespace snapshot
}  // namespace stablecore
