#include "escrowcore/transaction/transaction_engine.hpp"

#include <utility>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace transaction {

namespace {

constexpr std::string_view kComponent = "transaction";

using common::ErrorCode;

bool is_buyer(const Transaction& txn, const common::Actor& actor) {
  return !actor.is_system() && actor.id == txn.buyer;
}

bool is_seller(const Transaction& txn, const common::Actor& actor) {
  return !actor.is_system() && actor.id == txn.seller;
}

}  // namespace

std::string_view to_string(TransactionStatus status) noexcept {
  switch (status) {
    case TransactionStatus::kPending:
      return "PENDING";
    case TransactionStatus::kPaymentProcessing:
      return "PAYMENT_PROCESSING";
    case TransactionStatus::kEscrowHeld:
      return "ESCROW_HELD";
    case TransactionStatus::kCompleted:
      return "COMPLETED";
    case TransactionStatus::kCanceled:
      return "CANCELED";
    case TransactionStatus::kRefunded:
      return "REFUNDED";
    case TransactionStatus::kDisputed:
      return "DISPUTED";
    case TransactionStatus::kResolvedBuyer:
      return "RESOLVED_BUYER";
    case TransactionStatus::kResolvedSeller:
      return "RESOLVED_SELLER";
    case TransactionStatus::kResolvedSplit:
      return "RESOLVED_SPLIT";
  }
  return "UNKNOWN";
}

std::string_view to_string(Action action) noexcept {
  switch (action) {
    case Action::kInitiatePayment:
      return "initiate_payment";
    case Action::kConfirmDelivery:
      return "confirm_delivery";
    case Action::kCancel:
      return "cancel";
    case Action::kRefund:
      return "refund";
    case Action::kOpenDispute:
      return "open_dispute";
    case Action::kResolveDispute:
      return "resolve_dispute";
  }
  return "unknown";
}

TransactionEngine::Locked::Locked(TransactionEngine* engine, Slot* slot, std::unique_lock<std::timed_mutex> lock)
    : engine_(engine), slot_(slot), lock_(std::move(lock)) {}

TransactionEngine::Locked::Locked(Locked&& other) noexcept
    : engine_(std::exchange(other.engine_, nullptr)),
      slot_(other.slot_),
      lock_(std::move(other.lock_)),
      queued_(std::move(other.queued_)) {}

TransactionEngine::Locked::~Locked() {
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
  if (engine_) {
    engine_->publish(queued_);
  }
}

TransactionEngine::TransactionEngine(ledger::LedgerStore& ledger, hold::HoldManager& holds,
                                     events::EventPublisher& events, IdempotencyStore& idempotency,
                                     const common::Clock& clock, EngineOptions options,
                                     const auth::CapabilityRegistry* capabilities,
                                     telemetry::TelemetrySink* telemetry)
    : ledger_(ledger),
      holds_(holds),
      events_(events),
      idempotency_(idempotency),
      clock_(clock),
      options_(options),
      capabilities_(capabilities),
      telemetry_(telemetry) {}

common::Amount TransactionEngine::fee_for(common::Amount amount) const noexcept {
  return amount * options_.fee_basis_points / 10'000;
}

void TransactionEngine::reject(common::ErrorCode code) {
  if (telemetry_) {
    telemetry_->increment(telemetry::Metric::kRejectedCalls);
  }
  ESCROWCORE_LOG_DEBUG(kComponent, "rejected: " << common::to_string(code));
}

void TransactionEngine::publish(std::vector<events::Event>& queued) {
  for (auto& event : queued) {
    events_.publish(std::move(event));
  }
  queued.clear();
}

TransactionEngine::Slot* TransactionEngine::find_slot(common::TransactionId id) const {
  std::shared_lock lock(mutex_);
  auto it = transactions_.find(id);
  if (it == transactions_.end()) {
    return nullptr;
  }
  return it->second.get();
}

common::Outcome<TransactionEngine::Locked> TransactionEngine::acquire(common::TransactionId id,
                                                                      common::Deadline deadline) {
  auto* slot = find_slot(id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
  if (!common::lock_until(lock, deadline)) {
    return ErrorCode::kDeadlineExceeded;
  }
  return Locked(this, slot, std::move(lock));
}

common::Outcome<Transaction> TransactionEngine::transition(Locked& locked, TransactionStatus to,
                                                           const common::Actor& actor, std::string_view reason) {
  auto& txn = locked.slot_->state;
  const auto from = txn.status;
  if (!can_transition(from, to)) {
    return ErrorCode::kInvalidStateTransition;
  }

  const auto now = clock_.now();
  txn.status = to;
  txn.updated_at = now;
  if (to == TransactionStatus::kPaymentProcessing) {
    txn.payment_started_at = now;
  } else if (to == TransactionStatus::kEscrowHeld) {
    txn.escrow_held_at = now;
  } else if (to == TransactionStatus::kPending) {
    txn.payment_started_at = 0;
  } else if (is_terminal(to)) {
    txn.closed_at = now;
  }

  locked.slot_->history.push_back(HistoryEvent{
      .transaction = txn.id,
      .from = from,
      .to = to,
      .actor = actor,
      .reason = std::string(reason),
      .timestamp = now,
  });
  locked.queued_.push_back(events::Event{
      .type = events::EventType::kTransactionStatusChanged,
      .transaction = txn.id,
      .from_status = std::string(to_string(from)),
      .to_status = std::string(to_string(to)),
      .dispute = txn.dispute,
      .actor = actor,
      .timestamp = now,
  });
  if (telemetry_) {
    telemetry_->increment(telemetry::Metric::kTransitions);
  }
  ESCROWCORE_LOG_INFO(kComponent, "transaction " << txn.id << " " << to_string(from) << " -> " << to_string(to)
                                                 << " by " << common::to_string(actor.kind) << ":" << actor.id
                                                 << " (" << reason << ")");
  return txn;
}

void TransactionEngine::attach_dispute(Locked& locked, common::DisputeId dispute) {
  locked.slot_->state.dispute = dispute;
  locked.slot_->state.updated_at = clock_.now();
}

common::Outcome<Transaction> TransactionEngine::create(const CreateRequest& request, const std::string& idempotency_key,
                                                       common::Deadline deadline) {
  telemetry::ScopedLatency latency(telemetry_, "transaction.create");
  if (request.amount <= 0) {
    return fail<Transaction>(ErrorCode::kInvalidAmount);
  }
  if (request.buyer == request.seller) {
    return fail<Transaction>(ErrorCode::kSameParty);
  }
  if (!ledger_.supports(request.currency)) {
    return fail<Transaction>(ErrorCode::kUnsupportedCurrency);
  }

  std::unique_lock<std::timed_mutex> keyed(create_mutex_, std::defer_lock);
  if (!idempotency_key.empty()) {
    if (!common::lock_until(keyed, deadline)) {
      return fail<Transaction>(ErrorCode::kDeadlineExceeded);
    }
    if (auto replay = idempotency_.lookup(idempotency_key, Operation::kCreate, 0)) {
      if (!*replay) {
        return fail<Transaction>(replay->error());
      }
      if (telemetry_) {
        telemetry_->increment(telemetry::Metric::kIdempotentReplays);
      }
      return (*replay)->transaction;
    }
  }

  const auto now = clock_.now();
  auto slot = std::make_unique<Slot>();
  auto& txn = slot->state;
  txn.id = next_id_.fetch_add(1, std::memory_order_relaxed);
  txn.listing_ref = request.listing_ref;
  txn.buyer = request.buyer;
  txn.seller = request.seller;
  txn.amount = request.amount;
  txn.currency = request.currency;
  txn.fee = fee_for(request.amount);
  txn.status = TransactionStatus::kPending;
  txn.created_at = now;
  txn.updated_at = now;

  const common::Actor creator = common::Actor::user(request.buyer);
  slot->history.push_back(HistoryEvent{
      .transaction = txn.id,
      .from = std::nullopt,
      .to = TransactionStatus::kPending,
      .actor = creator,
      .reason = "created",
      .timestamp = now,
  });
  const Transaction created = txn;
  {
    std::unique_lock lock(mutex_);
    transactions_.emplace(created.id, std::move(slot));
  }
  idempotency_.remember(idempotency_key, Operation::kCreate, IdempotentReply{.transaction = created});
  if (keyed.owns_lock()) {
    keyed.unlock();
  }

  if (telemetry_) {
    telemetry_->increment(telemetry::Metric::kTransactionsCreated);
  }
  ESCROWCORE_LOG_INFO(kComponent, "transaction " << created.id << " created buyer=" << created.buyer
                                                 << " seller=" << created.seller << " amount=" << created.amount << " "
                                                 << created.currency << " fee=" << created.fee);
  events_.publish(events::Event{
      .type = events::EventType::kTransactionStatusChanged,
      .transaction = created.id,
      .from_status = {},
      .to_status = std::string(to_string(TransactionStatus::kPending)),
      .actor = creator,
      .timestamp = now,
  });
  return created;
}

common::Outcome<PaymentResult> TransactionEngine::initiate_payment(common::TransactionId id, common::WalletId wallet,
                                                                   const common::Actor& actor,
                                                                   const std::string& idempotency_key,
                                                                   common::Deadline deadline) {
  telemetry::ScopedLatency latency(telemetry_, "transaction.initiate_payment");
  auto locked = acquire(id, deadline);
  if (!locked) {
    return fail<PaymentResult>(locked.error());
  }
  auto& guard = locked.value();

  if (!idempotency_key.empty()) {
    if (auto replay = idempotency_.lookup(idempotency_key, Operation::kInitiatePayment, id)) {
      if (!*replay || !(*replay)->hold) {
        return fail<PaymentResult>(replay->ok() ? ErrorCode::kIdempotencyConflict : replay->error());
      }
      if (telemetry_) {
        telemetry_->increment(telemetry::Metric::kIdempotentReplays);
      }
      return PaymentResult{.transaction = (*replay)->transaction, .hold = *(*replay)->hold};
    }
  }

  const auto& txn = guard.transaction();
  if (!actor.is_system() && actor.id != txn.buyer) {
    return fail<PaymentResult>(ErrorCode::kForbidden);
  }
  if (txn.status != TransactionStatus::kPending) {
    return fail<PaymentResult>(ErrorCode::kInvalidStateTransition);
  }
  auto source = ledger_.get(wallet);
  if (!source) {
    return fail<PaymentResult>(source.error());
  }
  if (source->owner != txn.buyer) {
    return fail<PaymentResult>(ErrorCode::kForbidden);
  }
  if (source->currency != txn.currency) {
    return fail<PaymentResult>(ErrorCode::kCurrencyMismatch);
  }

  guard.slot_->state.buyer_wallet = wallet;
  guard.slot_->state.payment_key = idempotency_key;
  auto processing = transition(guard, TransactionStatus::kPaymentProcessing, actor, "payment initiated");
  if (!processing) {
    return fail<PaymentResult>(processing.error());
  }

  auto placed = holds_.place_hold(wallet, id, txn.amount, options_.hold_ttl, deadline);
  if (!placed) {
    const std::string reason = "hold rejected: " + std::string(common::to_string(placed.error()));
    auto rolled_back = transition(guard, TransactionStatus::kPending, actor, reason);
    if (!rolled_back) {
      ESCROWCORE_LOG_ERROR(kComponent, "transaction " << id << " could not roll back to PENDING");
    }
    return fail<PaymentResult>(placed.error());
  }

  guard.slot_->state.hold = placed->id;
  auto held = transition(guard, TransactionStatus::kEscrowHeld, actor, "funds held in escrow");
  if (!held) {
    return fail<PaymentResult>(held.error());
  }

  PaymentResult result{.transaction = held.value(), .hold = placed.value()};
  idempotency_.remember(idempotency_key, Operation::kInitiatePayment,
                        IdempotentReply{.transaction = result.transaction, .hold = result.hold});
  return result;
}

common::Outcome<Transaction> TransactionEngine::confirm_delivery(common::TransactionId id, const common::Actor& actor,
                                                                 const std::string& idempotency_key,
                                                                 common::Deadline deadline) {
  telemetry::ScopedLatency latency(telemetry_, "transaction.confirm_delivery");
  auto locked = acquire(id, deadline);
  if (!locked) {
    return fail<Transaction>(locked.error());
  }
  auto& guard = locked.value();

  if (!idempotency_key.empty()) {
    if (auto replay = idempotency_.lookup(idempotency_key, Operation::kConfirmDelivery, id)) {
      if (!*replay) {
        return fail<Transaction>(replay->error());
      }
      return (*replay)->transaction;
    }
  }

  const auto& txn = guard.transaction();
  if (!actor.is_system() && !is_buyer(txn, actor)) {
    return fail<Transaction>(ErrorCode::kForbidden);
  }
  if (txn.status != TransactionStatus::kEscrowHeld) {
    return fail<Transaction>(ErrorCode::kInvalidStateTransition);
  }

  auto payout = ledger_.open_wallet(txn.seller, txn.currency);
  if (!payout) {
    return fail<Transaction>(payout.error());
  }
  auto captured = holds_.capture_hold(txn.hold, payout->id, txn.fee, deadline);
  if (!captured) {
    return fail<Transaction>(captured.error());
  }

  auto completed = transition(guard, TransactionStatus::kCompleted, actor,
                              actor.is_system() ? "auto-released after delivery window" : "delivery confirmed");
  if (!completed) {
    return fail<Transaction>(completed.error());
  }
  idempotency_.remember(idempotency_key, Operation::kConfirmDelivery,
                        IdempotentReply{.transaction = completed.value(), .hold = captured.value()});
  return completed;
}

common::Outcome<Transaction> TransactionEngine::cancel(common::TransactionId id, const common::Actor& actor,
                                                       const std::string& idempotency_key, common::Deadline deadline) {
  telemetry::ScopedLatency latency(telemetry_, "transaction.cancel");
  auto locked = acquire(id, deadline);
  if (!locked) {
    return fail<Transaction>(locked.error());
  }
  auto& guard = locked.value();

  if (!idempotency_key.empty()) {
    if (auto replay = idempotency_.lookup(idempotency_key, Operation::kCancel, id)) {
      if (!*replay) {
        return fail<Transaction>(replay->error());
      }
      return (*replay)->transaction;
    }
  }

  const auto& txn = guard.transaction();
  if (!actor.is_system() && !txn.is_party(actor.id)) {
    return fail<Transaction>(ErrorCode::kForbidden);
  }
  if (txn.status == TransactionStatus::kPaymentProcessing) {
    if (!actor.is_system()) {
      return fail<Transaction>(ErrorCode::kInvalidStateTransition);
    }
    if (auto active = holds_.active_for_transaction(id)) {
      auto expired = holds_.expire_hold(active->id, actor, deadline);
      if (!expired) {
        return fail<Transaction>(expired.error());
      }
    }
  } else if (txn.status != TransactionStatus::kPending) {
    return fail<Transaction>(ErrorCode::kInvalidStateTransition);
  }

  std::string_view reason = "canceled by buyer";
  if (actor.is_system()) {
    reason = txn.status == TransactionStatus::kPending ? "pending expired" : "payment processing timed out";
  } else if (is_seller(txn, actor)) {
    reason = "canceled by seller";
  }
  auto canceled = transition(guard, TransactionStatus::kCanceled, actor, reason);
  if (!canceled) {
    return fail<Transaction>(canceled.error());
  }
  idempotency_.remember(idempotency_key, Operation::kCancel, IdempotentReply{.transaction = canceled.value()});
  return canceled;
}

common::Outcome<Transaction> TransactionEngine::refund(common::TransactionId id, const common::Actor& actor,
                                                       const std::string& idempotency_key, common::Deadline deadline) {
  telemetry::ScopedLatency latency(telemetry_, "transaction.refund");
  auto locked = acquire(id, deadline);
  if (!locked) {
    return fail<Transaction>(locked.error());
  }
  auto& guard = locked.value();

  if (!idempotency_key.empty()) {
    if (auto replay = idempotency_.lookup(idempotency_key, Operation::kRefund, id)) {
      if (!*replay) {
        return fail<Transaction>(replay->error());
      }
      return (*replay)->transaction;
    }
  }

  const auto& txn = guard.transaction();
  if (!actor.is_system() && !is_seller(txn, actor)) {
    return fail<Transaction>(ErrorCode::kForbidden);
  }
  if (txn.status != TransactionStatus::kEscrowHeld) {
    return fail<Transaction>(ErrorCode::kInvalidStateTransition);
  }
  auto released = holds_.release_hold(txn.hold, 1.0, deadline);
  if (!released) {
    return fail<Transaction>(released.error());
  }

  auto refunded = transition(guard, TransactionStatus::kRefunded, actor,
                             actor.is_system() ? "auto-refunded after delivery window" : "refunded by seller");
  if (!refunded) {
    return fail<Transaction>(refunded.error());
  }
  idempotency_.remember(idempotency_key, Operation::kRefund,
                        IdempotentReply{.transaction = refunded.value(), .hold = released.value()});
  return refunded;
}

common::Outcome<Transaction> TransactionEngine::get(common::TransactionId id) const {
  auto* slot = find_slot(id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::scoped_lock lock(slot->mutex);
  return slot->state;
}

std::vector<Transaction> TransactionEngine::list_by_party(const PartyFilter& filter) const {
  std::vector<Slot*> slots;
  {
    std::shared_lock lock(mutex_);
    slots.reserve(transactions_.size());
    for (const auto& [id, slot] : transactions_) {
      slots.push_back(slot.get());
    }
  }

  std::vector<Transaction> result;
  for (auto* slot : slots) {
    if (result.size() >= filter.limit) {
      break;
    }
    std::scoped_lock lock(slot->mutex);
    const auto& txn = slot->state;
    const bool matches_role = (filter.role != PartyRole::kSeller && txn.buyer == filter.user) ||
                              (filter.role != PartyRole::kBuyer && txn.seller == filter.user);
    if (!matches_role || (filter.status && txn.status != *filter.status)) {
      continue;
    }
    result.push_back(txn);
  }
  return result;
}

std::vector<Transaction> TransactionEngine::list_by_status(TransactionStatus status) const {
  std::vector<Slot*> slots;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, slot] : transactions_) {
      slots.push_back(slot.get());
    }
  }
  std::vector<Transaction> result;
  for (auto* slot : slots) {
    std::scoped_lock lock(slot->mutex);
    if (slot->state.status == status) {
      result.push_back(slot->state);
    }
  }
  return result;
}

common::Outcome<std::vector<HistoryEvent>> TransactionEngine::history(common::TransactionId id) const {
  auto* slot = find_slot(id);
  if (!slot) {
    return ErrorCode::kNotFound;
  }
  std::scoped_lock lock(slot->mutex);
  return slot->history;
}

common::Outcome<std::vector<Action>> TransactionEngine::available_actions(common::TransactionId id,
                                                                          const common::Actor& actor) const {
  auto current = get(id);
  if (!current) {
    return current.error();
  }
  const auto& txn = current.value();
  const bool buyer = is_buyer(txn, actor);
  const bool seller = is_seller(txn, actor);
  const bool system = actor.is_system();

  std::vector<Action> actions;
  switch (txn.status) {
    case TransactionStatus::kPending:
      if (buyer) {
        actions.push_back(Action::kInitiatePayment);
      }
      if (buyer || seller || system) {
        actions.push_back(Action::kCancel);
      }
      break;
    case TransactionStatus::kPaymentProcessing:
      if (buyer || seller) {
        actions.push_back(Action::kOpenDispute);
      }
      if (system) {
        actions.push_back(Action::kCancel);
      }
      break;
    case TransactionStatus::kEscrowHeld:
      if (buyer || system) {
        actions.push_back(Action::kConfirmDelivery);
      }
      if (seller || system) {
        actions.push_back(Action::kRefund);
      }
      if (buyer || seller) {
        actions.push_back(Action::kOpenDispute);
      }
      break;
    case TransactionStatus::kDisputed:
      if (!system && capabilities_ && capabilities_->has_capability(actor.id, auth::kModerate)) {
        actions.push_back(Action::kResolveDispute);
      }
      break;
    default:
      break;
  }
  return actions;
}

}  // namespace transaction
}  // namespace escrowcore
