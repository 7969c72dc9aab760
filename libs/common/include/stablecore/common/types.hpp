#pragma once

#include <cstdint>

namespace stablecore {
namespace common {

using AccountId = std::uint64_t;
using AssetId = std::uint32_t;
using FeedId = std::uint32_t;
using SequenceId = std::uint64_t;
using TimestampS = std::int64_t;

// Signed so that negative inputs can be represented and rejected. Stored
// balances never go below zero.
using Amount = __int128;

inline constexpr Amount kMaxAmount =
    static_cast<Amount>(~static_cast<unsigned __int128>(0) >> 1);

// 18-decimal fixed-point scale shared by prices, values and health factors.
inline constexpr Amount kPrecision = 1'000'000'000'000'000'000;

}  // namespace common
}  // namespace stablecore
