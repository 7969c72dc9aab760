#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "stablecore/common/types.hpp"

namespace stablecore {
namespace common {

using U128 = unsigned __int128;

struct U256 {
  U128 hi{0};
  U128 lo{0};

  friend bool operator==(const U256&, const U256&) = default;
};

// Full 128x128 -> 256 bit product.
U256 mul_wide(U128 a, U128 b) noexcept;

// floor(a * b / denominator) with a 256-bit intermediate product.
// Inputs must be non-negative and the denominator positive. Returns nullopt
// when an input is out of range or the quotient does not fit in Amount.
[[nodiscard]] std::optional<Amount> mul_div(Amount a, Amount b, Amount denominator) noexcept;

[[nodiscard]] std::optional<Amount> checked_add(Amount a, Amount b) noexcept;
[[nodiscard]] std::optional<Amount> checked_sub(Amount a, Amount b) noexcept;
[[nodiscard]] std::optional<Amount> checked_mul(Amount a, Amount b) noexcept;

// 10^exponent, nullopt above 10^38.
[[nodiscard]] std::optional<Amount> pow10(unsigned exponent) noexcept;

// Base-10 integer text, optionally signed.
std::string to_string(Amount value);
[[nodiscard]] std::optional<Amount> parse_amount(std::string_view text) noexcept;

// Renders a fixed-point value with the given number of decimals, trailing
// zeros trimmed: format_fixed(1'500'000'000'000'000'000, 18) == "1.5".
std::string format_fixed(Amount value, unsigned decimals = 18);

}  // namespace common
}  // namespace stablecore
