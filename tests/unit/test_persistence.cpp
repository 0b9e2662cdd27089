#include "test_persistence.hpp"

#include <array>
#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <span>

#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/ledger/journal.hpp"
#include "escrowcore/ledger/ledger_store.hpp"
#include "escrowcore/replay/replay_driver.hpp"
#include "escrowcore/snapshot/snapshot_store.hpp"
#include "escrowcore/wal/wal_writer.hpp"

namespace escrowcore::tests {

namespace fs = std::filesystem;

void test_persistence_replay() {
  const auto tmp_root = fs::temp_directory_path() / "escrowcore_tests_replay";
  fs::remove_all(tmp_root);

  snapshot::Store snapshot_store(tmp_root);
  struct SnapshotState {
    std::int64_t balance;
  } snapshot_state{.balance = 42};
  snapshot_store.persist(1, std::as_bytes(std::span(&snapshot_state, 1)));
  auto snap = snapshot_store.latest();
  assert(snap.has_value());
  assert(snap->sequence == 1);

  const auto wal_path = tmp_root / "events.wal";
  {
    wal::Writer writer(wal_path);
    auto append_int = [&](std::int32_t value) {
      std::array<std::byte, sizeof(value)> payload{};
      std::memcpy(payload.data(), &value, sizeof(value));
      return writer.append(wal::RecordView{.kind = 1, .payload = std::span<const std::byte>(payload)});
    };
    // Sequence 1 is covered by the snapshot.
    assert(append_int(1000) == 1);
    assert(append_int(10) == 2);
    assert(append_int(-5) == 3);
    writer.sync();
  }

  replay::Driver driver;
  driver.configure(tmp_root, wal_path);

  std::int64_t replay_balance = 0;
  driver.set_snapshot_handler([&](common::SequenceId seq, std::span<const std::byte> payload) {
    assert(seq == 1);
    assert(payload.size() == sizeof(SnapshotState));
    std::memcpy(&replay_balance, payload.data(), payload.size());
  });
  driver.set_event_handler([&](const wal::Record& record) {
    std::int32_t delta = 0;
    std::memcpy(&delta, record.payload.data(), sizeof(delta));
    replay_balance += delta;
  });

  const auto stats = driver.execute();
  assert(replay_balance == 47);
  assert(stats.snapshot_loaded);
  assert(stats.records_replayed == 2);
  assert(stats.last_sequence == 3);
  assert(stats.sequence_gaps == 0);
  assert(!stats.torn_tail);

  fs::remove_all(tmp_root);
}

void test_snapshot_generations() {
  const auto tmp_root = fs::temp_directory_path() / "escrowcore_tests_snapshots";
  fs::remove_all(tmp_root);

  snapshot::Store store(tmp_root, 2);
  assert(!store.latest());
  for (std::int64_t sequence = 10; sequence <= 40; sequence += 10) {
    const std::int64_t value = sequence * 2;
    store.persist(static_cast<common::SequenceId>(sequence), std::as_bytes(std::span(&value, 1)));
  }

  const auto kept = store.generations();
  assert(kept.size() == 2);
  assert(kept[0] == 40 && kept[1] == 30);
  assert(store.latest()->sequence == 40);

  // Cut the newest generation short; the older one takes over.
  const auto newest = tmp_root / "ledger-00000000000000000040.snapshot";
  assert(fs::exists(newest));
  fs::resize_file(newest, 8);
  auto fallback = store.latest();
  assert(fallback && fallback->sequence == 30);
  std::int64_t value = 0;
  std::memcpy(&value, fallback->payload.data(), sizeof(value));
  assert(value == 60);

  fs::remove_all(tmp_root);
}

namespace {

struct Balances {
  common::Amount buyer_available;
  common::Amount buyer_held;
  common::Amount seller_available;
};

// Journals a short history: deposits, a hold, a capture, a snapshot in the
// middle and a withdrawal after it.
Balances write_history(const fs::path& wal_path, const fs::path& snapshot_dir) {
  common::ManualClock clock;
  ledger::WalJournal journal(wal_path);
  ledger::LedgerStore ledger(clock, &journal);
  snapshot::Store snapshots(snapshot_dir);

  auto buyer = ledger.open_wallet(1, "USD");
  auto seller = ledger.open_wallet(2, "USD");
  assert(ledger.deposit(buyer->id, 10'000, "dep-1"));
  assert(ledger.move_available_to_held(buyer->id, 8'000, "txn-1/hold-1"));
  ledger.write_snapshot(snapshots);

  assert(ledger.release_held(buyer->id, 6'000, seller->id, "txn-1/hold-1"));
  assert(ledger.move_held_to_available(buyer->id, 2'000, "txn-1/hold-1"));
  assert(ledger.withdraw(seller->id, 1'000, "wd-1"));
  assert(ledger.set_status(seller->id, ledger::WalletStatus::kBlocked));
  journal.sync();

  return Balances{
      .buyer_available = ledger.get(buyer->id)->available,
      .buyer_held = ledger.get(buyer->id)->held,
      .seller_available = ledger.get(seller->id)->available,
  };
}

void check_recovered(const ledger::LedgerStore& ledger, const Balances& expected) {
  auto buyer = ledger.find(1, "USD");
  auto seller = ledger.find(2, "USD");
  assert(buyer && seller);
  assert(ledger.get(*buyer)->available == expected.buyer_available);
  assert(ledger.get(*buyer)->held == expected.buyer_held);
  assert(ledger.get(*seller)->available == expected.seller_available);
  assert(ledger.get(*seller)->status == ledger::WalletStatus::kBlocked);
  assert(ledger.reconcile(*buyer)->consistent());
  assert(ledger.reconcile(*seller)->consistent());
  assert(ledger.total_balance("USD") == 9'000);
}

}  // namespace

void test_ledger_recovery() {
  const auto tmp_root = fs::temp_directory_path() / "escrowcore_tests_recovery";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);
  const auto wal_path = tmp_root / "ledger.wal";
  const auto snapshot_dir = tmp_root / "snapshots";

  const auto expected = write_history(wal_path, snapshot_dir);
  assert(expected.buyer_available == 4'000);
  assert(expected.buyer_held == 0);
  assert(expected.seller_available == 5'000);

  common::ManualClock clock;
  ledger::LedgerStore recovered(clock);
  const auto stats = recovered.recover(snapshot_dir, wal_path);
  assert(stats.snapshot_loaded);
  assert(stats.records_replayed == 4);
  assert(!stats.torn_tail);
  check_recovered(recovered, expected);

  // Postings replayed into a recovered store are recognised as applied.
  auto buyer = recovered.find(1, "USD");
  auto repeat = recovered.move_held_to_available(*buyer, 2'000, "txn-1/hold-1");
  assert(repeat && repeat->duplicate);

  fs::remove_all(tmp_root);
}

void test_ledger_recovery_torn_tail() {
  const auto tmp_root = fs::temp_directory_path() / "escrowcore_tests_torn";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);
  const auto wal_path = tmp_root / "ledger.wal";
  const auto snapshot_dir = tmp_root / "snapshots";

  const auto expected = write_history(wal_path, snapshot_dir);

  // A crash mid-append leaves a partial header at the end of the log.
  {
    std::ofstream out(wal_path, std::ios::binary | std::ios::app);
    const char partial[7] = {'E', 'S', 'W', 'L', 0, 1, 0};
    out.write(partial, sizeof(partial));
  }

  common::ManualClock clock;
  ledger::LedgerStore recovered(clock);
  const auto stats = recovered.recover(snapshot_dir, wal_path);
  assert(stats.torn_tail);
  check_recovered(recovered, expected);

  // Reopening the journal discards the partial record and continues the sequence.
  ledger::WalJournal journal(wal_path);
  assert(journal.last_sequence() == stats.last_sequence);

  fs::remove_all(tmp_root);
}

}  // namespace escrowcore::tests
