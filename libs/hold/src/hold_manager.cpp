#include "escrowcore/hold/hold_manager.hpp"

#include <algorithm>
#include <cmath>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace hold {

namespace {

constexpr std::string_view kComponent = "hold";

using common::ErrorCode;

}  // namespace

std::string_view to_string(HoldStatus status) noexcept {
  switch (status) {
    case HoldStatus::kActive:
      return "active";
    case HoldStatus::kCaptured:
      return "captured";
    case HoldStatus::kReleased:
      return "released";
    case HoldStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

HoldManager::HoldManager(ledger::LedgerStore& ledger, const common::Clock& clock, HoldOptions options,
                         telemetry::TelemetrySink* telemetry)
    : ledger_(ledger), clock_(clock), options_(options), telemetry_(telemetry) {}

std::string HoldManager::ledger_ref(const Hold& hold, std::string_view suffix) {
  std::string ref = "txn-" + std::to_string(hold.transaction) + "/hold-" + std::to_string(hold.id);
  if (!suffix.empty()) {
    ref.push_back('/');
    ref.append(suffix);
  }
  return ref;
}

void HoldManager::count(telemetry::Metric metric) {
  if (telemetry_) {
    telemetry_->increment(metric);
  }
}

HoldManager::HoldSlot* HoldManager::find_slot(common::HoldId hold) const {
  std::shared_lock lock(mutex_);
  auto it = holds_.find(hold);
  if (it == holds_.end()) {
    return nullptr;
  }
  return it->second.get();
}

void HoldManager::retire(const Hold& hold) {
  std::unique_lock lock(mutex_);
  auto it = active_by_transaction_.find(hold.transaction);
  if (it != active_by_transaction_.end() && it->second == hold.id) {
    active_by_transaction_.erase(it);
  }
}

common::Outcome<common::WalletId> HoldManager::fee_wallet(const common::Currency& currency) {
  if (auto existing = ledger_.find(options_.platform_owner, currency)) {
    return *existing;
  }
  auto opened = ledger_.open_wallet(options_.platform_owner, currency);
  if (!opened) {
    return opened.error();
  }
  return opened->id;
}

common::Outcome<Hold> HoldManager::place_hold(common::WalletId wallet, common::TransactionId transaction,
                                              common::Amount amount, std::chrono::nanoseconds ttl,
                                              common::Deadline deadline) {
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }
  auto target = ledger_.get(wallet);
  if (!target) {
    return target.error();
  }

  Hold hold;
  {
    std::unique_lock lock(mutex_);
    if (active_by_transaction_.count(transaction) != 0 || !placing_.insert(transaction).second) {
      return ErrorCode::kDuplicateHold;
    }
    hold.id = next_id_++;
  }

  const auto now = clock_.now();
  hold.wallet = wallet;
  hold.transaction = transaction;
  hold.amount = amount;
  hold.currency = target->currency;
  hold.created_at = now;
  hold.expires_at = now + common::to_ns(ttl);

  auto posted = ledger_.move_available_to_held(wallet, amount, ledger_ref(hold), deadline);

  std::unique_lock lock(mutex_);
  placing_.erase(transaction);
  if (!posted) {
    ESCROWCORE_LOG_DEBUG(kComponent, "hold for transaction " << transaction << " rejected: "
                                                             << common::to_string(posted.error()));
    return posted.error();
  }

  auto slot = std::make_unique<HoldSlot>();
  slot->state = hold;
  holds_.emplace(hold.id, std::move(slot));
  active_by_transaction_[transaction] = hold.id;
  lock.unlock();

  count(telemetry::Metric::kHoldsPlaced);
  ESCROWCORE_LOG_INFO(kComponent, "hold " << hold.id << " placed on wallet " << wallet << " for transaction "
                                          << transaction << " amount=" << amount << " " << hold.currency);
  return hold;
}

common::Outcome<common::Amount> HoldManager::add_payout_legs(ledger::Posting& posting, const Hold& hold,
                                                             common::WalletId payout_wallet, common::Amount payout,
                                                             common::Amount fee) {
  if (payout - fee > 0) {
    posting.legs.push_back({.wallet = payout_wallet,
                            .available_delta = payout - fee,
                            .held_delta = 0,
                            .reason = ledger::EntryReason::kCapture});
  }
  if (fee > 0) {
    auto fees = fee_wallet(hold.currency);
    if (!fees) {
      return fees.error();
    }
    posting.legs.push_back(
        {.wallet = *fees, .available_delta = fee, .held_delta = 0, .reason = ledger::EntryReason::kFee});
  }
  return payout - fee;
}

common::Outcome<Hold> HoldManager::capture_hold(common::HoldId hold_id, common::WalletId payout_wallet,
                                                common::Amount fee, common::Deadline deadline) {
  auto* slot = find_slot(hold_id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
  if (!common::lock_until(lock, deadline)) {
    return ErrorCode::kDeadlineExceeded;
  }

  auto& hold = slot->state;
  if (!hold.active()) {
    return ErrorCode::kHoldNotActive;
  }
  const auto remaining = hold.remaining();
  if (fee < 0 || fee > remaining) {
    return ErrorCode::kInvalidAmount;
  }

  ledger::Posting posting{.txn_ref = ledger_ref(hold), .legs = {}};
  posting.legs.push_back(
      {.wallet = hold.wallet, .available_delta = 0, .held_delta = -remaining, .reason = ledger::EntryReason::kCapture});
  if (auto legs = add_payout_legs(posting, hold, payout_wallet, remaining, fee); !legs) {
    return legs.error();
  }

  auto posted = ledger_.post(posting, deadline);
  if (!posted) {
    return posted.error();
  }

  hold.captured_amount = remaining;
  hold.fee = fee;
  hold.status = HoldStatus::kCaptured;
  hold.resolved_at = clock_.now();
  retire(hold);
  count(telemetry::Metric::kHoldsCaptured);
  ESCROWCORE_LOG_INFO(kComponent, "hold " << hold.id << " captured " << remaining << " into wallet "
                                          << payout_wallet << " fee=" << fee);
  return hold;
}

common::Outcome<Hold> HoldManager::release_hold(common::HoldId hold_id, double fraction, common::Deadline deadline) {
  if (!(fraction > 0.0 && fraction <= 1.0)) {
    return ErrorCode::kInvalidAmount;
  }
  auto* slot = find_slot(hold_id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
  if (!common::lock_until(lock, deadline)) {
    return ErrorCode::kDeadlineExceeded;
  }

  auto& hold = slot->state;
  if (!hold.active()) {
    return ErrorCode::kHoldNotActive;
  }
  const bool full = fraction >= 1.0;
  if (!full && hold.released_amount > 0) {
    return ErrorCode::kHoldNotActive;
  }

  const auto remaining = hold.remaining();
  const auto amount = full ? remaining
                           : static_cast<common::Amount>(
                                 std::floor(static_cast<long double>(remaining) * static_cast<long double>(fraction)));
  if (amount <= 0) {
    return ErrorCode::kInvalidAmount;
  }

  auto posted = ledger_.move_held_to_available(hold.wallet, amount, ledger_ref(hold, full ? "" : "partial"),
                                               ledger::EntryReason::kRelease, deadline);
  if (!posted) {
    return posted.error();
  }

  hold.released_amount += amount;
  if (full) {
    hold.status = HoldStatus::kReleased;
    hold.resolved_at = clock_.now();
    retire(hold);
    count(telemetry::Metric::kHoldsReleased);
  }
  ESCROWCORE_LOG_INFO(kComponent, "hold " << hold.id << " released " << amount << " back to wallet " << hold.wallet
                                          << (full ? "" : " (partial)"));
  return hold;
}

common::Outcome<Hold> HoldManager::split_hold(common::HoldId hold_id, double buyer_fraction,
                                              common::WalletId payout_wallet, common::Amount fee,
                                              common::Deadline deadline) {
  if (!(buyer_fraction > 0.0 && buyer_fraction < 1.0)) {
    return ErrorCode::kInvalidAmount;
  }
  auto* slot = find_slot(hold_id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
  if (!common::lock_until(lock, deadline)) {
    return ErrorCode::kDeadlineExceeded;
  }

  auto& hold = slot->state;
  if (!hold.active() || hold.released_amount > 0) {
    return ErrorCode::kHoldNotActive;
  }
  const auto remaining = hold.remaining();
  const auto buyer_share = static_cast<common::Amount>(
      std::floor(static_cast<long double>(remaining) * static_cast<long double>(buyer_fraction)));
  const auto seller_share = remaining - buyer_share;
  if (fee < 0 || fee > seller_share) {
    return ErrorCode::kInvalidAmount;
  }

  // The buyer leg empties the held bucket; a share that floors to zero
  // leaves nothing to return.
  ledger::Posting posting{.txn_ref = ledger_ref(hold, "split"), .legs = {}};
  posting.legs.push_back({.wallet = hold.wallet,
                          .available_delta = buyer_share,
                          .held_delta = -remaining,
                          .reason = buyer_share > 0 ? ledger::EntryReason::kRelease : ledger::EntryReason::kCapture});
  if (auto legs = add_payout_legs(posting, hold, payout_wallet, seller_share, fee); !legs) {
    return legs.error();
  }

  auto posted = ledger_.post(posting, deadline);
  if (!posted) {
    return posted.error();
  }

  hold.released_amount = buyer_share;
  hold.captured_amount = seller_share;
  hold.fee = fee;
  hold.status = HoldStatus::kCaptured;
  hold.resolved_at = clock_.now();
  retire(hold);
  count(telemetry::Metric::kHoldsCaptured);
  ESCROWCORE_LOG_INFO(kComponent, "hold " << hold.id << " split: " << buyer_share << " back to wallet " << hold.wallet
                                          << ", " << seller_share << " into wallet " << payout_wallet
                                          << " fee=" << fee);
  return hold;
}

common::Outcome<Hold> HoldManager::extend_hold(common::HoldId hold_id, std::chrono::nanoseconds ttl,
                                               common::Deadline deadline) {
  if (ttl <= std::chrono::nanoseconds::zero()) {
    return ErrorCode::kInvalidAmount;
  }
  auto* slot = find_slot(hold_id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
  if (!common::lock_until(lock, deadline)) {
    return ErrorCode::kDeadlineExceeded;
  }

  auto& hold = slot->state;
  if (!hold.active()) {
    return ErrorCode::kHoldNotActive;
  }
  hold.expires_at = std::max(hold.expires_at, clock_.now() + common::to_ns(ttl));
  ESCROWCORE_LOG_DEBUG(kComponent, "hold " << hold.id << " extended to " << hold.expires_at);
  return hold;
}

common::Outcome<Hold> HoldManager::expire_hold(common::HoldId hold_id, const common::Actor& actor,
                                               common::Deadline deadline) {
  if (!actor.is_system()) {
    return ErrorCode::kForbidden;
  }
  auto* slot = find_slot(hold_id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
  if (!common::lock_until(lock, deadline)) {
    return ErrorCode::kDeadlineExceeded;
  }

  auto& hold = slot->state;
  if (!hold.active()) {
    return ErrorCode::kHoldNotActive;
  }
  const auto remaining = hold.remaining();
  auto posted =
      ledger_.move_held_to_available(hold.wallet, remaining, ledger_ref(hold), ledger::EntryReason::kExpire, deadline);
  if (!posted) {
    return posted.error();
  }

  hold.released_amount += remaining;
  hold.status = HoldStatus::kExpired;
  hold.resolved_at = clock_.now();
  retire(hold);
  count(telemetry::Metric::kHoldsExpired);
  ESCROWCORE_LOG_INFO(kComponent, "hold " << hold.id << " expired, " << remaining << " returned to wallet "
                                          << hold.wallet);
  return hold;
}

common::Outcome<Hold> HoldManager::get(common::HoldId hold) const {
  auto* slot = find_slot(hold);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::scoped_lock lock(slot->mutex);
  return slot->state;
}

std::optional<Hold> HoldManager::active_for_transaction(common::TransactionId transaction) const {
  common::HoldId id = 0;
  {
    std::shared_lock lock(mutex_);
    auto it = active_by_transaction_.find(transaction);
    if (it == active_by_transaction_.end()) {
      return std::nullopt;
    }
    id = it->second;
  }
  auto hold = get(id);
  if (!hold || !hold->active()) {
    return std::nullopt;
  }
  return hold.value();
}

std::vector<Hold> HoldManager::expired_active(common::TimestampNs now) const {
  std::vector<HoldSlot*> candidates;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [transaction, id] : active_by_transaction_) {
      candidates.push_back(holds_.at(id).get());
    }
  }
  std::vector<Hold> expired;
  for (auto* slot : candidates) {
    std::scoped_lock lock(slot->mutex);
    if (slot->state.active() && slot->state.expires_at <= now) {
      expired.push_back(slot->state);
    }
  }
  return expired;
}

}  // namespace hold
}  // namespace escrowcore
