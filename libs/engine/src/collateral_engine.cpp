#include "stablecore/engine/collateral_engine.hpp"

#include <string>
#include <utility>

#include "stablecore/common/fixed_point.hpp"
#include "stablecore/common/time_utils.hpp"

namespace stablecore {
namespace engine {

using common::Amount;
using common::Status;

namespace {

risk::RiskParameters validated(const risk::RiskParameters& parameters) {
  if (parameters.liquidation_threshold <= 0 || parameters.liquidation_threshold > risk::kLiquidationPrecision) {
    throw common::EngineError(Status::kConfigurationMismatch,
                              "liquidation threshold must be in 1..100, got " +
                                  common::to_string(parameters.liquidation_threshold));
  }
  if (parameters.liquidation_bonus < 0 || parameters.liquidation_bonus > risk::kLiquidationPrecision) {
    throw common::EngineError(Status::kConfigurationMismatch,
                              "liquidation bonus must be in 0..100, got " +
                                  common::to_string(parameters.liquidation_bonus));
  }
  if (parameters.min_health_factor <= 0) {
    throw common::EngineError(Status::kConfigurationMismatch, "minimum health factor must be positive");
  }
  return parameters;
}

OperationResult from_solvency(const risk::SolvencyResult& solvency) {
  return {.status = solvency.status, .health_factor = solvency.health_factor};
}

}  // namespace

CollateralEngine::CollateralEngine(std::vector<common::AssetId> assets,
                                   std::vector<oracle::FeedRef> feeds,
                                   oracle::PriceFeed& price_feed,
                                   Custody& custody,
                                   DebtToken& debt_token,
                                   EngineOptions options)
    : registry_(std::move(assets), std::move(feeds)),
      oracle_(price_feed, options.max_price_staleness_s, std::move(options.clock)),
      valuation_(registry_, oracle_),
      health_(ledger_, valuation_, validated(options.parameters)),
      positions_(registry_, health_, custody, debt_token, options.engine_account),
      liquidations_(registry_, valuation_, health_, positions_),
      telemetry_(options.telemetry) {}

void CollateralEngine::add_event_sink(ledger::EventSink& sink) {
  sinks_.push_back(&sink);
}

template <typename Result, typename Stage>
Result CollateralEngine::run_atomic(Metric metric, Stage&& stage) {
  const auto started = common::now_steady();

  ReentrancyGuard::Scope scope(guard_);
  if (!scope.acquired()) {
    Result rejected{};
    rejected.status = Status::kReentrancy;
    if (telemetry_) {
      telemetry_->increment(id(Metric::kReentrancyRejected));
    }
    record(metric, false, started);
    return rejected;
  }

  ledger::Journal journal(ledger_);
  Result result = stage(journal);
  if (result.ok()) {
    result.settled(journal.settle());
  }

  if (!result.ok()) {
    journal.rollback();
    if (telemetry_ && journal.failed_compensations() > 0) {
      telemetry_->increment(id(Metric::kCompensationFailed),
                            static_cast<std::int64_t>(journal.failed_compensations()));
    }
    record(metric, false, started);
    return result;
  }

  const auto events = journal.commit();
  for (const auto& event : events) {
    for (auto* sink : sinks_) {
      sink->publish(event);
    }
  }
  if (telemetry_ && !events.empty()) {
    telemetry_->increment(id(Metric::kEventsPublished), static_cast<std::int64_t>(events.size()));
  }
  record(metric, true, started);
  return result;
}

void CollateralEngine::record(Metric metric, bool ok, std::chrono::nanoseconds started) {
  if (!telemetry_) {
    return;
  }
  telemetry_->increment(id(metric));
  if (!ok) {
    telemetry_->increment(failure_id(metric));
  }
  telemetry_->record_latency(id(metric), common::now_steady() - started);
}

OperationResult CollateralEngine::deposit(common::AccountId account, common::AssetId asset, Amount amount) {
  return run_atomic<OperationResult>(Metric::kDeposit, [&](ledger::Journal& journal) {
    return OperationResult{.status = positions_.deposit(journal, account, asset, amount)};
  });
}

OperationResult CollateralEngine::mint(common::AccountId account, Amount amount) {
  return run_atomic<OperationResult>(Metric::kMint, [&](ledger::Journal& journal) {
    return positions_.mint(journal, account, amount);
  });
}

OperationResult CollateralEngine::deposit_and_mint(common::AccountId account, common::AssetId asset,
                                                   Amount collateral_amount, Amount mint_amount) {
  return run_atomic<OperationResult>(Metric::kDepositAndMint, [&](ledger::Journal& journal) {
    const Status deposited = positions_.deposit(journal, account, asset, collateral_amount);
    if (deposited != Status::kOk) {
      return OperationResult{.status = deposited};
    }
    return positions_.mint(journal, account, mint_amount);
  });
}

OperationResult CollateralEngine::redeem(common::AccountId account, common::AssetId asset, Amount amount) {
  return run_atomic<OperationResult>(Metric::kRedeem, [&](ledger::Journal& journal) {
    const Status redeemed = positions_.redeem(journal, account, account, asset, amount);
    if (redeemed != Status::kOk) {
      return OperationResult{.status = redeemed};
    }
    return from_solvency(health_.assert_solvent(account));
  });
}

OperationResult CollateralEngine::burn(common::AccountId account, Amount amount) {
  return run_atomic<OperationResult>(Metric::kBurn, [&](ledger::Journal& journal) {
    const Status burned = positions_.burn(journal, account, account, amount);
    if (burned != Status::kOk) {
      return OperationResult{.status = burned};
    }
    return from_solvency(health_.assert_solvent(account));
  });
}

OperationResult CollateralEngine::redeem_and_burn(common::AccountId account, common::AssetId asset,
                                                  Amount collateral_amount, Amount burn_amount) {
  return run_atomic<OperationResult>(Metric::kRedeemAndBurn, [&](ledger::Journal& journal) {
    if (collateral_amount <= 0) {
      return OperationResult{.status = Status::kInvalidAmount};
    }
    const Status burned = positions_.burn(journal, account, account, burn_amount);
    if (burned != Status::kOk) {
      return OperationResult{.status = burned};
    }
    const Status redeemed = positions_.redeem(journal, account, account, asset, collateral_amount);
    if (redeemed != Status::kOk) {
      return OperationResult{.status = redeemed};
    }
    return from_solvency(health_.assert_solvent(account));
  });
}

LiquidationResult CollateralEngine::liquidate(common::AccountId liquidator, common::AccountId target,
                                              common::AssetId asset, Amount debt_to_cover) {
  return run_atomic<LiquidationResult>(Metric::kLiquidate, [&](ledger::Journal& journal) {
    return liquidations_.liquidate(journal, liquidator, target, asset, debt_to_cover);
  });
}

Status CollateralEngine::restore(ledger::LedgerState state) {
  const auto started = common::now_steady();
  ReentrancyGuard::Scope scope(guard_);
  if (!scope.acquired()) {
    record(Metric::kRestore, false, started);
    return Status::kReentrancy;
  }
  ledger_ = std::move(state);
  record(Metric::kRestore, true, started);
  return Status::kOk;
}

risk::AmountResult CollateralEngine::usd_value(common::AssetId asset, Amount amount) const {
  return valuation_.usd_value(asset, amount);
}

risk::AmountResult CollateralEngine::token_amount_for_usd(common::AssetId asset, Amount usd_amount) const {
  return valuation_.asset_amount_for_value(asset, usd_amount);
}

risk::AmountResult CollateralEngine::total_collateral_value(common::AccountId account) const {
  return valuation_.total_collateral_value(ledger_, account);
}

risk::SummaryResult CollateralEngine::account_summary(common::AccountId account) const {
  return health_.account_summary(account);
}

risk::AmountResult CollateralEngine::health_factor(common::AccountId account) const {
  return health_.health_factor(account);
}

risk::AmountResult CollateralEngine::health_factor_for(Amount debt, Amount collateral_value) const {
  return health_.health_factor_for(debt, collateral_value);
}

LiquidationQuote CollateralEngine::quote_liquidation(common::AssetId asset, Amount debt_to_cover) const {
  return liquidations_.quote(asset, debt_to_cover);
}

Amount CollateralEngine::collateral_balance(common::AccountId account, common::AssetId asset) const {
  return ledger_.collateral(account, asset);
}

Amount CollateralEngine::debt_of(common::AccountId account) const {
  return ledger_.debt(account);
}

const std::vector<common::AssetId>& CollateralEngine::collateral_assets() const noexcept {
  return registry_.assets();
}

std::optional<oracle::FeedRef> CollateralEngine::feed_for(common::AssetId asset) const {
  return registry_.feed_for(asset);
}

const risk::RiskParameters& CollateralEngine::parameters() const noexcept {
  return health_.parameters();
}

}  // namespace engine
}  // namespace stablecore
