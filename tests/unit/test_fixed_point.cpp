#include "test_fixed_point.hpp"

#include <cassert>

#include "stablecore/common/fixed_point.hpp"
#include "test_support.hpp"

namespace stablecore::tests {

void test_mul_div() {
  using common::mul_div;

  assert(mul_div(6, 7, 3) == 14);
  assert(mul_div(10, 1, 3) == 3);  // floors
  assert(mul_div(0, units(5), 7) == 0);

  // $2000 * 1.5 WETH, both at 18 decimals.
  assert(mul_div(units(2'000), units(3) / 2, common::kPrecision) == units(3'000));

  // The intermediate product needs more than 128 bits.
  const common::Amount big = common::kMaxAmount / 2;
  assert(mul_div(big, units(1), units(1)) == big);
  assert(mul_div(common::kMaxAmount, common::kMaxAmount, common::kMaxAmount) == common::kMaxAmount);

  // Quotient overflow and invalid inputs.
  assert(!mul_div(common::kMaxAmount, 2, 1).has_value());
  assert(!mul_div(-1, 1, 1).has_value());
  assert(!mul_div(1, 1, 0).has_value());

  const auto wide = common::mul_wide(~static_cast<common::U128>(0), 2);
  assert(wide.hi == 1);
  assert(wide.lo == (~static_cast<common::U128>(0) << 1));
}

void test_checked_arithmetic() {
  assert(common::checked_add(units(1), units(2)) == units(3));
  assert(!common::checked_add(common::kMaxAmount, 1).has_value());
  assert(common::checked_sub(5, 7) == -2);
  assert(!common::checked_mul(common::kMaxAmount, 2).has_value());

  assert(common::pow10(0) == 1);
  assert(common::pow10(10) == 10'000'000'000);
  assert(common::pow10(18) == common::kPrecision);
  assert(!common::pow10(39).has_value());
}

void test_amount_text() {
  assert(common::to_string(0) == "0");
  assert(common::to_string(-42) == "-42");
  assert(common::to_string(units(1'000)) == "1000000000000000000000");

  assert(common::parse_amount("1_000_000") == 1'000'000);
  assert(common::parse_amount("-15") == -15);
  assert(common::parse_amount("1000000000000000000000") == units(1'000));
  assert(!common::parse_amount("").has_value());
  assert(!common::parse_amount("12x").has_value());
  assert(!common::parse_amount("-").has_value());
  assert(!common::parse_amount("999999999999999999999999999999999999999999").has_value());

  assert(common::format_fixed(units(3) / 2) == "1.5");
  assert(common::format_fixed(units(2'000)) == "2000");
  assert(common::format_fixed(-units(1) / 4) == "-0.25");
  assert(common::format_fixed(1) == "0.000000000000000001");
  assert(common::format_fixed(1'234, 0) == "1234");
}

}  // namespace stablecore::tests
