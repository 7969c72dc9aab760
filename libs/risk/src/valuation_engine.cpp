#include "stablecore/risk/valuation_engine.hpp"

#include "stablecore/common/fixed_point.hpp"

namespace stablecore {
namespace risk {

using common::Amount;
using common::Status;

AmountResult ValuationEngine::price_of(common::AssetId asset) const {
  const auto feed = registry_.feed_for(asset);
  if (!feed) {
    return {.status = Status::kUnsupportedAsset};
  }
  const auto price = oracle_.normalized_price(*feed);
  return {.status = price.status, .value = price.price};
}

AmountResult ValuationEngine::usd_value(common::AssetId asset, Amount amount) const {
  if (amount < 0) {
    return {.status = Status::kInvalidAmount};
  }
  const AmountResult price = price_of(asset);
  if (!price.ok()) {
    return price;
  }
  const auto value = common::mul_div(price.value, amount, common::kPrecision);
  if (!value) {
    return {.status = Status::kArithmeticOverflow};
  }
  return {.value = *value};
}

AmountResult ValuationEngine::asset_amount_for_value(common::AssetId asset, Amount usd_amount) const {
  if (usd_amount < 0) {
    return {.status = Status::kInvalidAmount};
  }
  const AmountResult price = price_of(asset);
  if (!price.ok()) {
    return price;
  }
  const auto amount = common::mul_div(usd_amount, common::kPrecision, price.value);
  if (!amount) {
    return {.status = Status::kArithmeticOverflow};
  }
  return {.value = *amount};
}

AmountResult ValuationEngine::total_collateral_value(const ledger::LedgerState& ledger,
                                                     common::AccountId account) const {
  Amount total = 0;
  for (const auto asset : registry_.assets()) {
    const AmountResult value = usd_value(asset, ledger.collateral(account, asset));
    if (!value.ok()) {
      return value;
    }
    const auto sum = common::checked_add(total, value.value);
    if (!sum) {
      return {.status = Status::kArithmeticOverflow};
    }
    total = *sum;
  }
  return {.value = total};
}

}  // namespace risk
}  // namespace stablecore
