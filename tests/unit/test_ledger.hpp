#pragma once

namespace stablecore::tests {

void test_ledger_credit_debit();
void test_journal_rollback();
void test_journal_settlement();
void test_event_codec();

}  // namespace stablecore::tests
