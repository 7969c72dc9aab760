#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "stablecore/common/status.hpp"
#include "stablecore/common/types.hpp"
#include "stablecore/engine/collaborators.hpp"
#include "stablecore/engine/liquidation_engine.hpp"
#include "stablecore/engine/metrics.hpp"
#include "stablecore/engine/position_engine.hpp"
#include "stablecore/engine/reentrancy_guard.hpp"
#include "stablecore/ledger/events.hpp"
#include "stablecore/ledger/journal.hpp"
#include "stablecore/ledger/ledger_state.hpp"
#include "stablecore/oracle/oracle_adapter.hpp"
#include "stablecore/oracle/price_feed.hpp"
#include "stablecore/risk/asset_registry.hpp"
#include "stablecore/risk/health_factor.hpp"
#include "stablecore/risk/valuation_engine.hpp"
#include "stablecore/telemetry/telemetry_sink.hpp"

namespace stablecore {
namespace engine {

struct EngineOptions {
  risk::RiskParameters parameters{};
  common::AccountId engine_account{0};
  common::TimestampS max_price_staleness_s{oracle::OracleAdapter::kDefaultMaxStaleness};
  oracle::OracleAdapter::Clock clock{};
  telemetry::TelemetrySink* telemetry{nullptr};
};

// Owns all balance state and is the only entry point that mutates it.
//
// Every mutating call is all-or-nothing: it holds the engine-wide reentrancy
// guard, stages its ledger changes and solvency checks in a journal, settles
// collaborator calls, and either commits (publishing events to every sink) or
// rolls everything back. Nested mutating calls, including ones made from
// collaborator callbacks, fail with kReentrancy.
//
// Construction throws common::EngineError(kConfigurationMismatch) when the
// asset and feed lists differ in length, an asset repeats, or the risk
// parameters are out of range.
class CollateralEngine {
 public:
  CollateralEngine(std::vector<common::AssetId> assets,
                   std::vector<oracle::FeedRef> feeds,
                   oracle::PriceFeed& price_feed,
                   Custody& custody,
                   DebtToken& debt_token,
                   EngineOptions options = {});
  CollateralEngine(const CollateralEngine&) = delete;
  CollateralEngine& operator=(const CollateralEngine&) = delete;

  void add_event_sink(ledger::EventSink& sink);

  OperationResult deposit(common::AccountId account, common::AssetId asset, common::Amount amount);
  OperationResult mint(common::AccountId account, common::Amount amount);
  OperationResult deposit_and_mint(common::AccountId account, common::AssetId asset,
                                   common::Amount collateral_amount, common::Amount mint_amount);
  OperationResult redeem(common::AccountId account, common::AssetId asset, common::Amount amount);
  OperationResult burn(common::AccountId account, common::Amount amount);
  OperationResult redeem_and_burn(common::AccountId account, common::AssetId asset,
                                  common::Amount collateral_amount, common::Amount burn_amount);
  LiquidationResult liquidate(common::AccountId liquidator, common::AccountId target, common::AssetId asset,
                              common::Amount debt_to_cover);

  // Replaces the whole ledger, e.g. with a state rebuilt by recovery.
  common::Status restore(ledger::LedgerState state);

  [[nodiscard]] risk::AmountResult usd_value(common::AssetId asset, common::Amount amount) const;
  [[nodiscard]] risk::AmountResult token_amount_for_usd(common::AssetId asset, common::Amount usd_amount) const;
  [[nodiscard]] risk::AmountResult total_collateral_value(common::AccountId account) const;
  [[nodiscard]] risk::SummaryResult account_summary(common::AccountId account) const;
  [[nodiscard]] risk::AmountResult health_factor(common::AccountId account) const;
  [[nodiscard]] risk::AmountResult health_factor_for(common::Amount debt, common::Amount collateral_value) const;
  [[nodiscard]] LiquidationQuote quote_liquidation(common::AssetId asset, common::Amount debt_to_cover) const;
  [[nodiscard]] common::Amount collateral_balance(common::AccountId account, common::AssetId asset) const;
  [[nodiscard]] common::Amount debt_of(common::AccountId account) const;
  [[nodiscard]] const std::vector<common::AssetId>& collateral_assets() const noexcept;
  [[nodiscard]] std::optional<oracle::FeedRef> feed_for(common::AssetId asset) const;
  [[nodiscard]] const risk::RiskParameters& parameters() const noexcept;
  [[nodiscard]] const ledger::LedgerState& state() const noexcept { return ledger_; }
  [[nodiscard]] common::AccountId engine_account() const noexcept { return positions_.engine_account(); }

 private:
  template <typename Result, typename Stage>
  Result run_atomic(Metric metric, Stage&& stage);

  void record(Metric metric, bool ok, std::chrono::nanoseconds started);

  risk::AssetRegistry registry_;
  oracle::OracleAdapter oracle_;
  ledger::LedgerState ledger_{};
  risk::ValuationEngine valuation_;
  risk::HealthFactorEngine health_;
  PositionEngine positions_;
  LiquidationEngine liquidations_;
  ReentrancyGuard guard_{};
  std::vector<ledger::EventSink*> sinks_{};
  telemetry::TelemetrySink* telemetry_{nullptr};
};

}  // namespace engine
}  // namespace stablecore
