#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "escrowcore/common/error.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/common/types.hpp"
#include "escrowcore/ledger/journal.hpp"
#include "escrowcore/ledger/ledger_types.hpp"
#include "escrowcore/replay/replay_driver.hpp"
#include "escrowcore/snapshot/snapshot_store.hpp"

namespace escrowcore {
namespace ledger {

struct LedgerOptions {
  std::vector<common::Currency> supported_currencies{"USD", "EUR", "GBP", "RUB", "JPY", "CNY"};
};

// Wallets and their append-only entry log. Every mutation is a Posting that
// is validated, journaled and only then applied, under the locks of exactly
// the wallets it touches. Re-posting a (wallet, txn_ref, reason) that already
// committed is a no-op.
class LedgerStore {
 public:
  explicit LedgerStore(const common::Clock& clock, Journal* journal = nullptr, LedgerOptions options = {});
  LedgerStore(const LedgerStore&) = delete;
  LedgerStore& operator=(const LedgerStore&) = delete;

  // One wallet per (owner, currency); returns the existing one if present.
  common::Outcome<Wallet> open_wallet(common::UserId owner, const common::Currency& currency);
  [[nodiscard]] common::Outcome<Wallet> get(common::WalletId wallet) const;
  [[nodiscard]] std::optional<common::WalletId> find(common::UserId owner, const common::Currency& currency) const;
  common::Outcome<Wallet> set_status(common::WalletId wallet, WalletStatus status);

  common::Outcome<PostingResult> credit_available(common::WalletId wallet, common::Amount amount, EntryReason reason,
                                                  const std::string& txn_ref,
                                                  common::Deadline deadline = common::no_deadline());
  common::Outcome<PostingResult> debit_available(common::WalletId wallet, common::Amount amount, EntryReason reason,
                                                 const std::string& txn_ref,
                                                 common::Deadline deadline = common::no_deadline());
  common::Outcome<PostingResult> move_available_to_held(common::WalletId wallet, common::Amount amount,
                                                        const std::string& txn_ref,
                                                        common::Deadline deadline = common::no_deadline());
  common::Outcome<PostingResult> move_held_to_available(common::WalletId wallet, common::Amount amount,
                                                        const std::string& txn_ref,
                                                        EntryReason reason = EntryReason::kRelease,
                                                        common::Deadline deadline = common::no_deadline());
  // Moves held funds out of `wallet` into the available balance of `destination`.
  common::Outcome<PostingResult> release_held(common::WalletId wallet, common::Amount amount,
                                              common::WalletId destination, const std::string& txn_ref,
                                              common::Deadline deadline = common::no_deadline());
  common::Outcome<PostingResult> post(const Posting& posting, common::Deadline deadline = common::no_deadline());

  // External money in and out; the only calls that change the system total.
  common::Outcome<Wallet> deposit(common::WalletId wallet, common::Amount amount, const std::string& reference,
                                  common::Deadline deadline = common::no_deadline());
  common::Outcome<Wallet> withdraw(common::WalletId wallet, common::Amount amount, const std::string& reference,
                                   common::Deadline deadline = common::no_deadline());

  [[nodiscard]] std::vector<LedgerEntry> entries(common::WalletId wallet) const;
  [[nodiscard]] common::Outcome<ReconcileReport> reconcile(common::WalletId wallet) const;
  [[nodiscard]] common::Amount total_balance(const common::Currency& currency) const;
  [[nodiscard]] std::vector<Wallet> wallets() const;
  [[nodiscard]] bool supports(const common::Currency& currency) const;

  // Writes wallets and entries as of the journal's last sequence.
  void write_snapshot(snapshot::Store& store);
  // Loads the latest snapshot and replays newer journal records. Call on an
  // empty store, before serving traffic.
  replay::ReplayStats recover(const std::filesystem::path& snapshot_dir, const std::filesystem::path& wal_path);

 private:
  struct WalletSlot {
    mutable std::timed_mutex mutex;
    Wallet state{};
    std::vector<LedgerEntry> entries{};
    std::unordered_set<std::string> applied_keys{};
  };

  const common::Clock& clock_;
  Journal* journal_;
  LedgerOptions options_;

  // Guards the slot maps; slots themselves are never erased.
  mutable std::shared_mutex slots_mutex_;
  std::map<common::WalletId, std::unique_ptr<WalletSlot>> slots_;
  std::map<std::pair<common::UserId, common::Currency>, common::WalletId> by_owner_;
  common::WalletId next_wallet_id_{1};

  // Held shared by committing postings, exclusively by snapshots.
  mutable std::shared_mutex commit_gate_;
  std::atomic<common::SequenceId> next_entry_sequence_{1};

  WalletSlot* find_slot(common::WalletId wallet) const;
  common::Outcome<PostingResult> apply_posting(const Posting& posting, common::TimestampNs timestamp,
                                               common::Deadline deadline, bool journal);
  void replay_record(const wal::Record& record);
  void load_snapshot(std::span<const std::byte> payload);

  static std::string applied_key(const std::string& txn_ref, EntryReason reason);
};

}  // namespace ledger
}  // namespace escrowcore
