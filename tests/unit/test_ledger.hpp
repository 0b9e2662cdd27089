#pragma once

namespace escrowcore::tests {

void test_ledger_deposit_withdraw();
void test_ledger_conservation();
void test_ledger_duplicate_posting();
void test_ledger_wallet_status();
void test_ledger_reconcile();
void test_ledger_journal_failure();
void test_ledger_deadline_exceeded();

}  // namespace escrowcore::tests
