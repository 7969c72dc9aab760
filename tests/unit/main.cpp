// Unit test runner - calls test functions from per-component test files

#include "test_auth.hpp"
#include "test_config.hpp"
#include "test_engine.hpp"
#include "test_fixed_point.hpp"
#include "test_ledger.hpp"
#include "test_liquidation.hpp"
#include "test_oracle.hpp"
#include "test_persistence.hpp"
#include "test_request.hpp"
#include "test_risk.hpp"
#include "test_telemetry.hpp"

int main() {
  using namespace stablecore::tests;

  // Fixed-point tests
  test_mul_div();
  test_checked_arithmetic();
  test_amount_text();

  // Ledger tests
  test_ledger_credit_debit();
  test_journal_rollback();
  test_journal_settlement();
  test_event_codec();

  // Oracle tests
  test_oracle_normalization();
  test_oracle_staleness();

  // Risk tests
  test_asset_registry();
  test_valuation();
  test_valuation_round_trip();
  test_health_factor();

  // Engine tests
  test_deposit_and_mint();
  test_mint_and_redeem_limits();
  test_burn_and_redeem_and_burn();
  test_collaborator_failures();
  test_engine_account_is_reserved();
  test_reentrancy_rejected();
  test_stale_price_blocks_risk_operations();
  test_engine_configuration();

  // Liquidation tests
  test_liquidation_quote();
  test_liquidation_partial_and_full();
  test_liquidation_rejections();
  test_liquidator_must_stay_solvent();

  // Request/auth tests
  test_request_codec();
  test_parse_command();
  test_dispatch();
  test_signature_verification();
  test_request_authentication();

  // Config tests
  test_config_defaults();
  test_config_overrides();
  test_config_validation();

  // Telemetry tests
  test_telemetry_sink();
  test_engine_metrics();

  // Persistence/replay tests
  test_wal_append_and_read();
  test_wal_rejects_corruption();
  test_snapshot_ledger_codec();
  test_persistence_replay();

  return 0;
}
