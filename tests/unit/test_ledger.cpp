#include "test_ledger.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/ledger/ledger_store.hpp"
#include "test_support.hpp"

namespace escrowcore::tests {

using common::ErrorCode;

void test_ledger_deposit_withdraw() {
  common::ManualClock clock;
  ledger::LedgerStore ledger(clock);

  auto wallet = ledger.open_wallet(7, "USD");
  assert(wallet);
  auto again = ledger.open_wallet(7, "USD");
  assert(again && again->id == wallet->id);
  assert(ledger.open_wallet(7, "XXX").error() == ErrorCode::kUnsupportedCurrency);

  auto deposited = ledger.deposit(wallet->id, 10'000, "dep-1");
  assert(deposited && deposited->available == 10'000);
  assert(ledger.deposit(wallet->id, 0, "dep-0").error() == ErrorCode::kInvalidAmount);

  auto withdrawn = ledger.withdraw(wallet->id, 2'500, "wd-1");
  assert(withdrawn && withdrawn->available == 7'500);
  assert(ledger.withdraw(wallet->id, 7'501, "wd-2").error() == ErrorCode::kInsufficientFunds);
  assert(ledger.get(wallet->id)->available == 7'500);
  assert(ledger.get(999).error() == ErrorCode::kNotFound);

  assert(ledger.total_balance("USD") == 7'500);
}

void test_ledger_conservation() {
  common::ManualClock clock;
  ledger::LedgerStore ledger(clock);

  std::vector<common::WalletId> wallets;
  for (common::UserId owner = 1; owner <= 4; ++owner) {
    auto wallet = ledger.open_wallet(owner, "EUR");
    assert(wallet);
    assert(ledger.deposit(wallet->id, 50'000, "seed-" + std::to_string(owner)));
    wallets.push_back(wallet->id);
  }
  const auto before = ledger.total_balance("EUR");
  assert(before == 200'000);

  // Hold and release money between wallets from several threads; none of it
  // may change the system total.
  std::vector<std::thread> workers;
  for (std::size_t t = 0; t < wallets.size(); ++t) {
    workers.emplace_back([&, t] {
      const auto from = wallets[t];
      const auto to = wallets[(t + 1) % wallets.size()];
      for (int i = 0; i < 50; ++i) {
        const std::string ref = "w" + std::to_string(t) + "-" + std::to_string(i);
        if (ledger.move_available_to_held(from, 100, ref)) {
          auto moved = ledger.release_held(from, 100, to, ref);
          assert(moved);
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(ledger.total_balance("EUR") == before);
  for (const auto id : wallets) {
    auto wallet = ledger.get(id);
    assert(wallet->available >= 0 && wallet->held == 0);
    assert(ledger.reconcile(id)->consistent());
  }
}

void test_ledger_duplicate_posting() {
  common::ManualClock clock;
  ledger::LedgerStore ledger(clock);
  auto wallet = ledger.open_wallet(1, "USD");
  assert(ledger.deposit(wallet->id, 1'000, "dep"));

  auto held = ledger.move_available_to_held(wallet->id, 400, "txn-1/hold-1");
  assert(held && !held->duplicate && held->entries.size() == 1);

  auto repeat = ledger.move_available_to_held(wallet->id, 400, "txn-1/hold-1");
  assert(repeat && repeat->duplicate);
  assert(ledger.get(wallet->id)->held == 400);
  assert(ledger.entries(wallet->id).size() == 2);

  // Same deposit reference twice credits once.
  assert(ledger.deposit(wallet->id, 1'000, "dep"));
  assert(ledger.get(wallet->id)->total() == 1'000);
}

void test_ledger_wallet_status() {
  common::ManualClock clock;
  ledger::LedgerStore ledger(clock);
  auto wallet = ledger.open_wallet(3, "GBP");
  assert(ledger.deposit(wallet->id, 500, "dep"));
  assert(ledger.move_available_to_held(wallet->id, 200, "txn-9/hold-1"));

  auto blocked = ledger.set_status(wallet->id, ledger::WalletStatus::kBlocked);
  assert(blocked && blocked->status == ledger::WalletStatus::kBlocked);
  assert(ledger.deposit(wallet->id, 100, "dep-2").error() == ErrorCode::kWalletUnavailable);
  assert(ledger.withdraw(wallet->id, 100, "wd").error() == ErrorCode::kWalletUnavailable);
  // Releasing money already held stays possible on a blocked wallet.
  assert(ledger.move_held_to_available(wallet->id, 200, "txn-9/hold-1"));

  assert(ledger.set_status(wallet->id, ledger::WalletStatus::kClosed).error() ==
         ErrorCode::kInvalidStateTransition);
  assert(ledger.set_status(wallet->id, ledger::WalletStatus::kActive));
  assert(ledger.withdraw(wallet->id, 500, "wd-all"));
  assert(ledger.set_status(wallet->id, ledger::WalletStatus::kClosed));
  assert(ledger.set_status(wallet->id, ledger::WalletStatus::kActive).error() ==
         ErrorCode::kInvalidStateTransition);
}

void test_ledger_reconcile() {
  common::ManualClock clock;
  ledger::LedgerStore ledger(clock);
  auto buyer = ledger.open_wallet(1, "USD");
  auto seller = ledger.open_wallet(2, "USD");
  assert(ledger.deposit(buyer->id, 10'000, "dep"));
  assert(ledger.move_available_to_held(buyer->id, 8'000, "txn-1/hold-1"));
  assert(ledger.release_held(buyer->id, 8'000, seller->id, "txn-1/hold-1"));

  auto report = ledger.reconcile(buyer->id);
  assert(report && report->consistent());
  assert(report->derived_available == 2'000 && report->derived_held == 0);
  assert(report->entry_count == 3);
  assert(ledger.reconcile(seller->id)->derived_available == 8'000);
  assert(ledger.reconcile(42).error() == ErrorCode::kNotFound);
}

void test_ledger_journal_failure() {
  common::ManualClock clock;
  ControlledJournal journal;
  ledger::LedgerStore ledger(clock, &journal);
  auto wallet = ledger.open_wallet(5, "USD");
  assert(ledger.deposit(wallet->id, 5'000, "dep"));
  const auto sequence = journal.last_sequence();

  journal.fail_next(1);
  assert(ledger.deposit(wallet->id, 100, "dep-2").error() == ErrorCode::kStoreUnavailable);
  assert(ledger.get(wallet->id)->available == 5'000);
  assert(ledger.entries(wallet->id).size() == 1);
  assert(ledger.reconcile(wallet->id)->consistent());
  assert(journal.last_sequence() == sequence);

  // Nothing was recorded, so the same reference applies once the journal is back.
  auto retried = ledger.deposit(wallet->id, 100, "dep-2");
  assert(retried && retried->available == 5'100);
  assert(ledger.entries(wallet->id).size() == 2);
}

void test_ledger_deadline_exceeded() {
  common::ManualClock clock;
  ControlledJournal journal;
  ledger::LedgerStore ledger(clock, &journal);
  auto wallet = ledger.open_wallet(6, "USD");
  assert(ledger.deposit(wallet->id, 5'000, "dep"));

  journal.stall();
  std::thread slow([&] {
    auto deposited = ledger.deposit(wallet->id, 100, "slow");
    assert(deposited);
  });
  journal.wait_for_stalled_append();

  auto late = ledger.withdraw(wallet->id, 50, "late", common::deadline_after(std::chrono::milliseconds(20)));
  assert(late.error() == ErrorCode::kDeadlineExceeded);

  journal.resume();
  slow.join();
  assert(ledger.get(wallet->id)->available == 5'100);
  for (const auto& entry : ledger.entries(wallet->id)) {
    assert(entry.txn_ref != "late");
  }
}

}  // namespace escrowcore::tests
