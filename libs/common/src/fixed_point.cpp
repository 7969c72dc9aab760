#include "stablecore/common/fixed_point.hpp"

#include <algorithm>

namespace stablecore {
namespace common {

namespace {
constexpr U128 kLow64Mask = 0xFFFF'FFFF'FFFF'FFFFULL;
constexpr U128 kMaxAmountUnsigned = static_cast<U128>(kMaxAmount);

// Quotient of a 256-bit numerator by a 128-bit divisor. The caller guarantees
// num.hi < denom so the quotient fits in 128 bits.
U128 div_wide(U256 num, U128 denom) noexcept {
  if (num.hi == 0) {
    return num.lo / denom;
  }

  U128 remainder = num.hi;
  U128 quotient = 0;
  for (int bit = 127; bit >= 0; --bit) {
    const bool carry = (remainder >> 127) != 0;
    remainder = (remainder << 1) | ((num.lo >> bit) & 1);
    quotient <<= 1;
    if (carry || remainder >= denom) {
      remainder -= denom;  // wraps back into range when carry is set
      quotient |= 1;
    }
  }
  return quotient;
}

}  // namespace

U256 mul_wide(U128 a, U128 b) noexcept {
  const U128 a_lo = a & kLow64Mask;
  const U128 a_hi = a >> 64;
  const U128 b_lo = b & kLow64Mask;
  const U128 b_hi = b >> 64;

  const U128 p0 = a_lo * b_lo;
  const U128 p1 = a_lo * b_hi;
  const U128 p2 = a_hi * b_lo;
  const U128 p3 = a_hi * b_hi;

  const U128 middle = (p0 >> 64) + (p1 & kLow64Mask) + (p2 & kLow64Mask);

  U256 result;
  result.lo = (p0 & kLow64Mask) | (middle << 64);
  result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (middle >> 64);
  return result;
}

std::optional<Amount> mul_div(Amount a, Amount b, Amount denominator) noexcept {
  if (a < 0 || b < 0 || denominator <= 0) {
    return std::nullopt;
  }

  const U128 ud = static_cast<U128>(denominator);
  const U256 product = mul_wide(static_cast<U128>(a), static_cast<U128>(b));
  if (product.hi >= ud) {
    return std::nullopt;
  }

  const U128 quotient = div_wide(product, ud);
  if (quotient > kMaxAmountUnsigned) {
    return std::nullopt;
  }
  return static_cast<Amount>(quotient);
}

std::optional<Amount> checked_add(Amount a, Amount b) noexcept {
  Amount out{};
  if (__builtin_add_overflow(a, b, &out)) {
    return std::nullopt;
  }
  return out;
}

std::optional<Amount> checked_sub(Amount a, Amount b) noexcept {
  Amount out{};
  if (__builtin_sub_overflow(a, b, &out)) {
    return std::nullopt;
  }
  return out;
}

std::optional<Amount> checked_mul(Amount a, Amount b) noexcept {
  Amount out{};
  if (__builtin_mul_overflow(a, b, &out)) {
    return std::nullopt;
  }
  return out;
}

std::optional<Amount> pow10(unsigned exponent) noexcept {
  if (exponent > 38) {
    return std::nullopt;
  }
  Amount value = 1;
  for (unsigned i = 0; i < exponent; ++i) {
    value *= 10;
  }
  return value;
}

std::string to_string(Amount value) {
  if (value == 0) {
    return "0";
  }

  const bool negative = value < 0;
  // Negate through the unsigned type so the minimum value does not overflow.
  U128 magnitude = negative ? (~static_cast<U128>(value) + 1) : static_cast<U128>(value);

  std::string digits;
  while (magnitude != 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
    magnitude /= 10;
  }
  if (negative) {
    digits.push_back('-');
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::optional<Amount> parse_amount(std::string_view text) noexcept {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  Amount value = 0;
  for (char c : text) {
    if (c == '_' || c == '\'') {
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto scaled = checked_mul(value, 10);
    if (!scaled) {
      return std::nullopt;
    }
    auto next = checked_add(*scaled, static_cast<Amount>(c - '0'));
    if (!next) {
      return std::nullopt;
    }
    value = *next;
  }
  return negative ? -value : value;
}

std::string format_fixed(Amount value, unsigned decimals) {
  const auto scale = pow10(decimals);
  if (!scale || decimals == 0) {
    return to_string(value);
  }

  const bool negative = value < 0;
  const U128 magnitude = negative ? (~static_cast<U128>(value) + 1) : static_cast<U128>(value);
  const U128 unsigned_scale = static_cast<U128>(*scale);

  std::string whole = to_string(static_cast<Amount>(magnitude / unsigned_scale));
  std::string fraction = to_string(static_cast<Amount>(magnitude % unsigned_scale));
  fraction.insert(0, decimals - fraction.size(), '0');
  while (!fraction.empty() && fraction.back() == '0') {
    fraction.pop_back();
  }

  std::string out = negative ? "-" : "";
  out += whole;
  if (!fraction.empty()) {
    out += '.';
    out += fraction;
  }
  return out;
}

}  // namespace common
}  // namespace stablecore
