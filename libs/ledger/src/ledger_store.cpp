#include "escrowcore/ledger/ledger_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "byte_codec.hpp"
#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace ledger {

namespace {

constexpr std::string_view kComponent = "ledger";

using common::ErrorCode;

// Legs a non-active wallet still accepts: funds leaving escrow, either back
// to the wallet's own available balance or out to a counterparty.
bool allowed_on_inactive_wallet(const PostingLeg& leg) noexcept {
  return leg.held_delta < 0 && leg.available_delta >= 0 && leg.available_delta <= -leg.held_delta;
}

}  // namespace

std::string_view to_string(WalletStatus status) noexcept {
  switch (status) {
    case WalletStatus::kActive:
      return "active";
    case WalletStatus::kBlocked:
      return "blocked";
    case WalletStatus::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string_view to_string(EntryReason reason) noexcept {
  switch (reason) {
    case EntryReason::kDeposit:
      return "deposit";
    case EntryReason::kWithdrawal:
      return "withdrawal";
    case EntryReason::kHold:
      return "hold";
    case EntryReason::kCapture:
      return "capture";
    case EntryReason::kRelease:
      return "release";
    case EntryReason::kFee:
      return "fee";
    case EntryReason::kExpire:
      return "expire";
  }
  return "unknown";
}

LedgerStore::LedgerStore(const common::Clock& clock, Journal* journal, LedgerOptions options)
    : clock_(clock), journal_(journal), options_(std::move(options)) {}

std::string LedgerStore::applied_key(const std::string& txn_ref, EntryReason reason) {
  std::string key = txn_ref;
  key.push_back('#');
  key.append(to_string(reason));
  return key;
}

bool LedgerStore::supports(const common::Currency& currency) const {
  return std::find(options_.supported_currencies.begin(), options_.supported_currencies.end(), currency) !=
         options_.supported_currencies.end();
}

LedgerStore::WalletSlot* LedgerStore::find_slot(common::WalletId wallet) const {
  std::shared_lock lock(slots_mutex_);
  auto it = slots_.find(wallet);
  if (it == slots_.end()) {
    return nullptr;
  }
  return it->second.get();
}

common::Outcome<Wallet> LedgerStore::open_wallet(common::UserId owner, const common::Currency& currency) {
  if (!supports(currency)) {
    return ErrorCode::kUnsupportedCurrency;
  }

  std::shared_lock gate(commit_gate_);
  std::unique_lock lock(slots_mutex_);
  if (auto it = by_owner_.find({owner, currency}); it != by_owner_.end()) {
    const auto& slot = *slots_.at(it->second);
    std::scoped_lock wallet_lock(slot.mutex);
    return slot.state;
  }

  const common::WalletId id = next_wallet_id_;
  if (journal_) {
    try {
      journal_->append(JournalKind::kWalletOpened,
                       encode(WalletOpenedRecord{.wallet = id, .owner = owner, .currency = currency}));
    } catch (const std::exception& ex) {
      ESCROWCORE_LOG_ERROR(kComponent, "journal append failed opening wallet for owner " << owner << ": " << ex.what());
      return ErrorCode::kStoreUnavailable;
    }
  }

  ++next_wallet_id_;
  auto slot = std::make_unique<WalletSlot>();
  slot->state = Wallet{.id = id, .owner = owner, .currency = currency};
  Wallet snapshot = slot->state;
  slots_.emplace(id, std::move(slot));
  by_owner_.emplace(std::make_pair(owner, currency), id);
  ESCROWCORE_LOG_DEBUG(kComponent, "opened wallet " << id << " owner=" << owner << " currency=" << currency);
  return snapshot;
}

common::Outcome<Wallet> LedgerStore::get(common::WalletId wallet) const {
  auto* slot = find_slot(wallet);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::scoped_lock lock(slot->mutex);
  return slot->state;
}

std::optional<common::WalletId> LedgerStore::find(common::UserId owner, const common::Currency& currency) const {
  std::shared_lock lock(slots_mutex_);
  if (auto it = by_owner_.find({owner, currency}); it != by_owner_.end()) {
    return it->second;
  }
  return std::nullopt;
}

common::Outcome<Wallet> LedgerStore::set_status(common::WalletId wallet, WalletStatus status) {
  auto* slot = find_slot(wallet);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::scoped_lock lock(slot->mutex);
  if (slot->state.status == status) {
    return slot->state;
  }
  if (slot->state.status == WalletStatus::kClosed) {
    return ErrorCode::kInvalidStateTransition;
  }
  if (status == WalletStatus::kClosed && slot->state.total() != 0) {
    return ErrorCode::kInvalidStateTransition;
  }

  std::shared_lock gate(commit_gate_);
  if (journal_) {
    try {
      journal_->append(JournalKind::kWalletStatus, encode(WalletStatusRecord{.wallet = wallet, .status = status}));
    } catch (const std::exception& ex) {
      ESCROWCORE_LOG_ERROR(kComponent, "journal append failed for wallet " << wallet << " status: " << ex.what());
      return ErrorCode::kStoreUnavailable;
    }
  }
  slot->state.status = status;
  ++slot->state.version;
  ESCROWCORE_LOG_INFO(kComponent, "wallet " << wallet << " is now " << to_string(status));
  return slot->state;
}

common::Outcome<PostingResult> LedgerStore::credit_available(common::WalletId wallet, common::Amount amount,
                                                             EntryReason reason, const std::string& txn_ref,
                                                             common::Deadline deadline) {
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }
  return post(Posting{.txn_ref = txn_ref,
                      .legs = {{.wallet = wallet, .available_delta = amount, .held_delta = 0, .reason = reason}}},
              deadline);
}

common::Outcome<PostingResult> LedgerStore::debit_available(common::WalletId wallet, common::Amount amount,
                                                            EntryReason reason, const std::string& txn_ref,
                                                            common::Deadline deadline) {
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }
  return post(Posting{.txn_ref = txn_ref,
                      .legs = {{.wallet = wallet, .available_delta = -amount, .held_delta = 0, .reason = reason}}},
              deadline);
}

common::Outcome<PostingResult> LedgerStore::move_available_to_held(common::WalletId wallet, common::Amount amount,
                                                                   const std::string& txn_ref,
                                                                   common::Deadline deadline) {
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }
  return post(Posting{.txn_ref = txn_ref,
                      .legs = {{.wallet = wallet,
                                .available_delta = -amount,
                                .held_delta = amount,
                                .reason = EntryReason::kHold}}},
              deadline);
}

common::Outcome<PostingResult> LedgerStore::move_held_to_available(common::WalletId wallet, common::Amount amount,
                                                                   const std::string& txn_ref, EntryReason reason,
                                                                   common::Deadline deadline) {
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }
  return post(Posting{.txn_ref = txn_ref,
                      .legs = {{.wallet = wallet, .available_delta = amount, .held_delta = -amount, .reason = reason}}},
              deadline);
}

common::Outcome<PostingResult> LedgerStore::release_held(common::WalletId wallet, common::Amount amount,
                                                         common::WalletId destination, const std::string& txn_ref,
                                                         common::Deadline deadline) {
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }
  return post(Posting{.txn_ref = txn_ref,
                      .legs = {{.wallet = wallet, .available_delta = 0, .held_delta = -amount, .reason = EntryReason::kCapture},
                               {.wallet = destination,
                                .available_delta = amount,
                                .held_delta = 0,
                                .reason = EntryReason::kCapture}}},
              deadline);
}

common::Outcome<PostingResult> LedgerStore::post(const Posting& posting, common::Deadline deadline) {
  return apply_posting(posting, clock_.now(), deadline, true);
}

common::Outcome<Wallet> LedgerStore::deposit(common::WalletId wallet, common::Amount amount,
                                             const std::string& reference, common::Deadline deadline) {
  auto result = credit_available(wallet, amount, EntryReason::kDeposit, reference, deadline);
  if (!result) {
    return result.error();
  }
  return get(wallet);
}

common::Outcome<Wallet> LedgerStore::withdraw(common::WalletId wallet, common::Amount amount,
                                              const std::string& reference, common::Deadline deadline) {
  auto result = debit_available(wallet, amount, EntryReason::kWithdrawal, reference, deadline);
  if (!result) {
    return result.error();
  }
  return get(wallet);
}

common::Outcome<PostingResult> LedgerStore::apply_posting(const Posting& posting, common::TimestampNs timestamp,
                                                          common::Deadline deadline, bool journal) {
  if (posting.legs.empty() || posting.txn_ref.empty()) {
    return ErrorCode::kInvalidAmount;
  }

  // Ordered by wallet id, which is also the lock acquisition order.
  std::map<common::WalletId, WalletSlot*> involved;
  for (const auto& leg : posting.legs) {
    auto* slot = find_slot(leg.wallet);
    if (!slot) {
      return ErrorCode::kNotFound;
    }
    involved.emplace(leg.wallet, slot);
  }

  std::vector<std::unique_lock<std::timed_mutex>> locks;
  locks.reserve(involved.size());
  for (auto& [id, slot] : involved) {
    std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
    if (!common::lock_until(lock, deadline)) {
      return ErrorCode::kDeadlineExceeded;
    }
    locks.push_back(std::move(lock));
  }

  const common::Currency& currency = involved.begin()->second->state.currency;
  std::unordered_set<std::string> seen;
  std::size_t already_applied = 0;
  for (const auto& leg : posting.legs) {
    if (leg.available_delta == 0 && leg.held_delta == 0) {
      return ErrorCode::kInvalidAmount;
    }
    const auto* slot = involved.at(leg.wallet);
    if (slot->state.currency != currency) {
      return ErrorCode::kCurrencyMismatch;
    }
    const auto key = applied_key(posting.txn_ref, leg.reason);
    if (!seen.insert(std::to_string(leg.wallet) + '/' + key).second) {
      return ErrorCode::kIdempotencyConflict;
    }
    if (slot->applied_keys.count(key) != 0) {
      ++already_applied;
    }
  }

  if (already_applied == posting.legs.size()) {
    return PostingResult{.duplicate = true, .entries = {}};
  }
  if (already_applied != 0) {
    ESCROWCORE_LOG_WARN(kComponent, "posting " << posting.txn_ref << " partially matches committed entries");
    return ErrorCode::kIdempotencyConflict;
  }

  std::map<common::WalletId, std::pair<common::Amount, common::Amount>> deltas;
  for (const auto& leg : posting.legs) {
    const auto* slot = involved.at(leg.wallet);
    if (slot->state.status != WalletStatus::kActive && !allowed_on_inactive_wallet(leg)) {
      return ErrorCode::kWalletUnavailable;
    }
    auto& [available, held] = deltas[leg.wallet];
    available += leg.available_delta;
    held += leg.held_delta;
  }
  for (const auto& [id, delta] : deltas) {
    const auto& state = involved.at(id)->state;
    if (state.available + delta.first < 0 || state.held + delta.second < 0) {
      return ErrorCode::kInsufficientFunds;
    }
  }

  std::shared_lock gate(commit_gate_);
  if (journal && journal_) {
    try {
      journal_->append(JournalKind::kPosting, encode(PostingRecord{.timestamp = timestamp, .posting = posting}));
    } catch (const std::exception& ex) {
      ESCROWCORE_LOG_ERROR(kComponent, "journal append failed for " << posting.txn_ref << ": " << ex.what());
      return ErrorCode::kStoreUnavailable;
    }
  }

  PostingResult result;
  result.entries.reserve(posting.legs.size());
  for (const auto& leg : posting.legs) {
    auto* slot = involved.at(leg.wallet);
    LedgerEntry entry{
        .sequence = next_entry_sequence_.fetch_add(1, std::memory_order_relaxed),
        .wallet = leg.wallet,
        .amount = leg.available_delta + leg.held_delta,
        .available_delta = leg.available_delta,
        .held_delta = leg.held_delta,
        .currency = slot->state.currency,
        .reason = leg.reason,
        .txn_ref = posting.txn_ref,
        .timestamp = timestamp,
    };
    slot->state.available += leg.available_delta;
    slot->state.held += leg.held_delta;
    ++slot->state.version;
    slot->applied_keys.insert(applied_key(posting.txn_ref, leg.reason));
    slot->entries.push_back(entry);
    result.entries.push_back(std::move(entry));
  }
  return result;
}

std::vector<LedgerEntry> LedgerStore::entries(common::WalletId wallet) const {
  auto* slot = find_slot(wallet);
  if (!slot) {
    return {};
  }
  std::scoped_lock lock(slot->mutex);
  return slot->entries;
}

common::Outcome<ReconcileReport> LedgerStore::reconcile(common::WalletId wallet) const {
  auto* slot = find_slot(wallet);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::scoped_lock lock(slot->mutex);
  ReconcileReport report{
      .wallet = wallet,
      .cached_available = slot->state.available,
      .cached_held = slot->state.held,
      .entry_count = slot->entries.size(),
  };
  for (const auto& entry : slot->entries) {
    report.derived_available += entry.available_delta;
    report.derived_held += entry.held_delta;
  }
  if (!report.consistent()) {
    ESCROWCORE_LOG_ERROR(kComponent, "wallet " << wallet << " drifted from its entry log: cached "
                                                << report.cached_available << "/" << report.cached_held
                                                << " derived " << report.derived_available << "/"
                                                << report.derived_held);
  }
  return report;
}

common::Amount LedgerStore::total_balance(const common::Currency& currency) const {
  // Exclusive gate: no posting can be half-applied while we sum.
  std::unique_lock gate(commit_gate_);
  std::shared_lock lock(slots_mutex_);
  common::Amount total = 0;
  for (const auto& [id, slot] : slots_) {
    if (slot->state.currency == currency) {
      total += slot->state.total();
    }
  }
  return total;
}

std::vector<Wallet> LedgerStore::wallets() const {
  std::shared_lock lock(slots_mutex_);
  std::vector<Wallet> result;
  result.reserve(slots_.size());
  for (const auto& [id, slot] : slots_) {
    std::scoped_lock wallet_lock(slot->mutex);
    result.push_back(slot->state);
  }
  return result;
}

void LedgerStore::write_snapshot(snapshot::Store& store) {
  std::vector<std::byte> payload;
  common::SequenceId sequence = 0;
  {
    std::unique_lock gate(commit_gate_);
    std::shared_lock lock(slots_mutex_);
    sequence = journal_ ? journal_->last_sequence() : 0;

    detail::ByteWriter out;
    out.put(next_wallet_id_);
    out.put(next_entry_sequence_.load(std::memory_order_relaxed));
    out.put(static_cast<std::uint64_t>(slots_.size()));
    for (const auto& [id, slot] : slots_) {
      const auto& state = slot->state;
      out.put(state.id);
      out.put(state.owner);
      out.put_string(state.currency);
      out.put(state.available);
      out.put(state.held);
      out.put(static_cast<std::uint8_t>(state.status));
      out.put(state.version);
      out.put(static_cast<std::uint64_t>(slot->entries.size()));
      for (const auto& entry : slot->entries) {
        out.put(entry.sequence);
        out.put(entry.available_delta);
        out.put(entry.held_delta);
        out.put(static_cast<std::uint8_t>(entry.reason));
        out.put_string(entry.txn_ref);
        out.put(entry.timestamp);
      }
    }
    payload = out.take();
  }
  store.persist(sequence, payload);
  ESCROWCORE_LOG_INFO(kComponent, "snapshot written at journal sequence " << sequence << " (" << payload.size()
                                                                         << " bytes)");
}

void LedgerStore::load_snapshot(std::span<const std::byte> payload) {
  detail::ByteReader in(payload);
  std::unique_lock lock(slots_mutex_);
  next_wallet_id_ = in.get<common::WalletId>();
  next_entry_sequence_.store(in.get<common::SequenceId>(), std::memory_order_relaxed);
  const auto wallet_count = in.get<std::uint64_t>();
  for (std::uint64_t i = 0; i < wallet_count; ++i) {
    auto slot = std::make_unique<WalletSlot>();
    auto& state = slot->state;
    state.id = in.get<common::WalletId>();
    state.owner = in.get<common::UserId>();
    state.currency = in.get_string();
    state.available = in.get<common::Amount>();
    state.held = in.get<common::Amount>();
    state.status = static_cast<WalletStatus>(in.get<std::uint8_t>());
    state.version = in.get<std::uint64_t>();
    const auto entry_count = in.get<std::uint64_t>();
    slot->entries.reserve(entry_count);
    for (std::uint64_t e = 0; e < entry_count; ++e) {
      LedgerEntry entry;
      entry.sequence = in.get<common::SequenceId>();
      entry.wallet = state.id;
      entry.available_delta = in.get<common::Amount>();
      entry.held_delta = in.get<common::Amount>();
      entry.amount = entry.available_delta + entry.held_delta;
      entry.currency = state.currency;
      entry.reason = static_cast<EntryReason>(in.get<std::uint8_t>());
      entry.txn_ref = in.get_string();
      entry.timestamp = in.get<common::TimestampNs>();
      slot->applied_keys.insert(applied_key(entry.txn_ref, entry.reason));
      slot->entries.push_back(std::move(entry));
    }
    by_owner_.emplace(std::make_pair(state.owner, state.currency), state.id);
    slots_.emplace(state.id, std::move(slot));
  }
  in.expect_end();
}

void LedgerStore::replay_record(const wal::Record& record) {
  const std::span<const std::byte> payload(record.payload.data(), record.payload.size());
  switch (static_cast<JournalKind>(record.header.kind)) {
    case JournalKind::kWalletOpened: {
      const auto opened = decode_wallet_opened(payload);
      std::unique_lock lock(slots_mutex_);
      auto slot = std::make_unique<WalletSlot>();
      slot->state = Wallet{.id = opened.wallet, .owner = opened.owner, .currency = opened.currency};
      slots_.emplace(opened.wallet, std::move(slot));
      by_owner_.emplace(std::make_pair(opened.owner, opened.currency), opened.wallet);
      next_wallet_id_ = std::max(next_wallet_id_, opened.wallet + 1);
      return;
    }
    case JournalKind::kPosting: {
      const auto posted = decode_posting(payload);
      auto result = apply_posting(posted.posting, posted.timestamp, common::no_deadline(), false);
      if (!result) {
        throw std::runtime_error("journal replay rejected posting " + posted.posting.txn_ref + ": " +
                                 std::string(common::to_string(result.error())));
      }
      return;
    }
    case JournalKind::kWalletStatus: {
      const auto changed = decode_wallet_status(payload);
      auto* slot = find_slot(changed.wallet);
      if (!slot) {
        throw std::runtime_error("journal status change for unknown wallet " + std::to_string(changed.wallet));
      }
      std::scoped_lock lock(slot->mutex);
      slot->state.status = changed.status;
      ++slot->state.version;
      return;
    }
  }
  throw std::runtime_error("unknown journal record kind " + std::to_string(record.header.kind));
}

replay::ReplayStats LedgerStore::recover(const std::filesystem::path& snapshot_dir,
                                         const std::filesystem::path& wal_path) {
  replay::Driver driver;
  driver.configure(snapshot_dir, wal_path);
  driver.set_snapshot_handler([this](common::SequenceId, std::span<const std::byte> payload) {
    load_snapshot(payload);
  });
  driver.set_event_handler([this](const wal::Record& record) { replay_record(record); });

  const auto stats = driver.execute();
  ESCROWCORE_LOG_INFO(kComponent, "recovered ledger: snapshot=" << (stats.snapshot_loaded ? "yes" : "no")
                                                                << " replayed=" << stats.records_replayed
                                                                << " last_sequence=" << stats.last_sequence);
  if (stats.torn_tail) {
    ESCROWCORE_LOG_WARN(kComponent, "ignored an incomplete trailing journal record");
  }
  return stats;
}

}  // namespace ledger
}  // namespace escrowcore
