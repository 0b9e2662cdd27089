#include "escrowcore/dispute/dispute_resolver.hpp"

#include <cmath>
#include <utility>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace dispute {

namespace {

constexpr std::string_view kComponent = "dispute";

using common::ErrorCode;
using transaction::Operation;
using transaction::TransactionStatus;

TransactionStatus status_for(Resolution resolution) noexcept {
  switch (resolution) {
    case Resolution::kBuyer:
      return TransactionStatus::kResolvedBuyer;
    case Resolution::kSeller:
      return TransactionStatus::kResolvedSeller;
    case Resolution::kSplit:
      return TransactionStatus::kResolvedSplit;
  }
  return TransactionStatus::kResolvedBuyer;
}

DisputeStatus dispute_status_for(Resolution resolution) noexcept {
  switch (resolution) {
    case Resolution::kBuyer:
      return DisputeStatus::kResolvedBuyer;
    case Resolution::kSeller:
      return DisputeStatus::kResolvedSeller;
    case Resolution::kSplit:
      return DisputeStatus::kResolvedSplit;
  }
  return DisputeStatus::kResolvedBuyer;
}

common::Amount buyer_share(const transaction::Transaction& txn, double ratio) {
  return static_cast<common::Amount>(
      std::floor(static_cast<long double>(txn.amount) * static_cast<long double>(ratio)));
}

// The platform keeps the fee in proportion to what the seller receives. Taken
// from the integer seller share so that 1 - ratio never rounds it down.
common::Amount split_fee(const transaction::Transaction& txn, double ratio) {
  const auto seller_share = txn.amount - buyer_share(txn, ratio);
  return static_cast<common::Amount>(std::floor(static_cast<long double>(txn.fee) *
                                                static_cast<long double>(seller_share) /
                                                static_cast<long double>(txn.amount)));
}

}  // namespace

std::string_view to_string(DisputeStatus status) noexcept {
  switch (status) {
    case DisputeStatus::kOpen:
      return "open";
    case DisputeStatus::kResolvedBuyer:
      return "resolved_buyer";
    case DisputeStatus::kResolvedSeller:
      return "resolved_seller";
    case DisputeStatus::kResolvedSplit:
      return "resolved_split";
  }
  return "unknown";
}

std::string_view to_string(Resolution resolution) noexcept {
  switch (resolution) {
    case Resolution::kBuyer:
      return "buyer";
    case Resolution::kSeller:
      return "seller";
    case Resolution::kSplit:
      return "split";
  }
  return "unknown";
}

DisputeResolver::DisputeResolver(transaction::TransactionEngine& transactions, events::EventPublisher& events,
                                 const auth::CapabilityRegistry& capabilities, const common::Clock& clock,
                                 telemetry::TelemetrySink* telemetry)
    : transactions_(transactions),
      events_(events),
      capabilities_(capabilities),
      clock_(clock),
      telemetry_(telemetry) {}

void DisputeResolver::count(telemetry::Metric metric) {
  if (telemetry_) {
    telemetry_->increment(metric);
  }
}

void DisputeResolver::emit(events::EventType type, const Dispute& dispute, const common::Actor& actor,
                           std::string_view from) {
  std::string to = "dispute:";
  to.append(type == events::EventType::kDisputeEscalated ? std::string_view("escalated") : to_string(dispute.status));
  events_.publish(events::Event{
      .type = type,
      .transaction = dispute.transaction,
      .from_status = std::string(from),
      .to_status = std::move(to),
      .dispute = dispute.id,
      .actor = actor,
      .timestamp = clock_.now(),
  });
}

common::Outcome<Dispute> DisputeResolver::open(const OpenRequest& request, const common::Actor& opener,
                                               const std::string& idempotency_key, common::Deadline deadline) {
  Dispute opened;
  {
    auto locked = transactions_.acquire(request.transaction, deadline);
    if (!locked) {
      transactions_.reject(locked.error());
      return locked.error();
    }
    auto& guard = locked.value();

    if (!idempotency_key.empty()) {
      if (auto replay = transactions_.idempotency().lookup(idempotency_key, Operation::kOpenDispute,
                                                           request.transaction)) {
        if (!*replay || !(*replay)->dispute) {
          return replay->ok() ? ErrorCode::kIdempotencyConflict : replay->error();
        }
        return get(*(*replay)->dispute);
      }
    }

    const auto& txn = guard.transaction();
    if (opener.is_system() || !txn.is_party(opener.id)) {
      transactions_.reject(ErrorCode::kForbidden);
      return ErrorCode::kForbidden;
    }
    if (txn.dispute != 0) {
      transactions_.reject(ErrorCode::kAlreadyDisputed);
      return ErrorCode::kAlreadyDisputed;
    }
    if (txn.status != TransactionStatus::kPaymentProcessing && txn.status != TransactionStatus::kEscrowHeld) {
      transactions_.reject(ErrorCode::kInvalidStateTransition);
      return ErrorCode::kInvalidStateTransition;
    }

    {
      std::scoped_lock lock(mutex_);
      opened.id = next_id_++;
    }
    opened.transaction = txn.id;
    opened.opener = opener.id;
    opened.reason = request.reason;
    opened.evidence_refs = request.evidence_refs;
    opened.opened_at = clock_.now();

    transactions_.attach_dispute(guard, opened.id);
    auto disputed = transactions_.transition(guard, TransactionStatus::kDisputed, opener,
                                             "dispute opened: " + request.reason);
    if (!disputed) {
      transactions_.attach_dispute(guard, 0);
      return disputed.error();
    }

    {
      std::scoped_lock lock(mutex_);
      disputes_.emplace(opened.id, opened);
      by_transaction_[opened.transaction] = opened.id;
    }
    transactions_.idempotency().remember(
        idempotency_key, Operation::kOpenDispute,
        transaction::IdempotentReply{.transaction = disputed.value(), .dispute = opened.id});
  }

  count(telemetry::Metric::kDisputesOpened);
  ESCROWCORE_LOG_INFO(kComponent, "dispute " << opened.id << " opened on transaction " << opened.transaction
                                             << " by user " << opened.opener);
  emit(events::EventType::kDisputeOpened, opened, opener, {});
  return opened;
}

common::ErrorCode DisputeResolver::settle_funds(const transaction::Transaction& txn, const ResolveRequest& request,
                                                common::Deadline deadline) {
  auto& holds = transactions_.holds();
  if (txn.hold == 0) {
    return ErrorCode::kNone;
  }
  auto current = holds.get(txn.hold);
  if (!current) {
    return current.error();
  }
  if (!current->active()) {
    // Funds moved on an earlier attempt that did not finish the transition;
    // only the same decision may complete it.
    return settled_as(current.value(), txn, request) ? ErrorCode::kNone : ErrorCode::kInvalidStateTransition;
  }

  if (request.resolution == Resolution::kBuyer) {
    auto released = holds.release_hold(txn.hold, 1.0, deadline);
    return released ? ErrorCode::kNone : released.error();
  }

  auto payout = transactions_.ledger().open_wallet(txn.seller, txn.currency);
  if (!payout) {
    return payout.error();
  }

  if (request.resolution == Resolution::kSplit) {
    auto split = holds.split_hold(txn.hold, request.split_ratio, payout->id, split_fee(txn, request.split_ratio),
                                  deadline);
    return split ? ErrorCode::kNone : split.error();
  }

  auto captured = holds.capture_hold(txn.hold, payout->id, txn.fee, deadline);
  return captured ? ErrorCode::kNone : captured.error();
}

bool DisputeResolver::settled_as(const hold::Hold& hold, const transaction::Transaction& txn,
                                 const ResolveRequest& request) {
  switch (request.resolution) {
    case Resolution::kBuyer:
      return hold.status == hold::HoldStatus::kReleased;
    case Resolution::kSeller:
      return hold.status == hold::HoldStatus::kCaptured && hold.released_amount == 0 && hold.fee == txn.fee;
    case Resolution::kSplit:
      return hold.status == hold::HoldStatus::kCaptured && hold.fee == split_fee(txn, request.split_ratio) &&
             hold.released_amount == buyer_share(txn, request.split_ratio);
  }
  return false;
}

common::Outcome<ResolveResult> DisputeResolver::resolve(const ResolveRequest& request, const common::Actor& resolver,
                                                        const std::string& idempotency_key,
                                                        common::Deadline deadline) {
  if (resolver.is_system() || !capabilities_.has_capability(resolver.id, auth::kModerate)) {
    transactions_.reject(ErrorCode::kForbidden);
    return ErrorCode::kForbidden;
  }
  if (request.resolution == Resolution::kSplit && !(request.split_ratio > 0.0 && request.split_ratio < 1.0)) {
    transactions_.reject(ErrorCode::kInvalidAmount);
    return ErrorCode::kInvalidAmount;
  }

  auto existing = get(request.dispute);
  if (!existing) {
    return existing.error();
  }

  ResolveResult result;
  {
    auto locked = transactions_.acquire(existing->transaction, deadline);
    if (!locked) {
      transactions_.reject(locked.error());
      return locked.error();
    }
    auto& guard = locked.value();

    if (!idempotency_key.empty()) {
      if (auto replay = transactions_.idempotency().lookup(idempotency_key, Operation::kResolveDispute,
                                                           existing->transaction)) {
        if (!*replay || !(*replay)->dispute) {
          return replay->ok() ? ErrorCode::kIdempotencyConflict : replay->error();
        }
        auto stored = get(*(*replay)->dispute);
        if (!stored) {
          return stored.error();
        }
        return ResolveResult{.dispute = stored.value(), .transaction = (*replay)->transaction};
      }
    }

    // Re-read under the transaction lock; a concurrent resolve may have won.
    auto current = get(request.dispute);
    if (!current) {
      return current.error();
    }
    if (!current->open()) {
      transactions_.reject(ErrorCode::kAlreadyResolved);
      return ErrorCode::kAlreadyResolved;
    }

    const auto& txn = guard.transaction();
    if (txn.status != TransactionStatus::kDisputed) {
      transactions_.reject(ErrorCode::kInvalidStateTransition);
      return ErrorCode::kInvalidStateTransition;
    }

    if (const auto settled = settle_funds(txn, request, deadline); settled != ErrorCode::kNone) {
      ESCROWCORE_LOG_WARN(kComponent, "dispute " << request.dispute << " funds not settled: "
                                                 << common::to_string(settled));
      transactions_.reject(settled);
      return settled;
    }

    const std::string reason = "dispute resolved for " + std::string(to_string(request.resolution));
    auto resolved = transactions_.transition(guard, status_for(request.resolution), resolver, reason);
    if (!resolved) {
      return resolved.error();
    }

    {
      std::scoped_lock lock(mutex_);
      auto& dispute = disputes_.at(request.dispute);
      dispute.status = dispute_status_for(request.resolution);
      dispute.resolution_note = request.note;
      dispute.split_ratio = request.resolution == Resolution::kSplit   ? request.split_ratio
                            : request.resolution == Resolution::kBuyer ? 1.0
                                                                       : 0.0;
      dispute.resolved_at = clock_.now();
      dispute.resolver = resolver.id;
      result.dispute = dispute;
    }
    result.transaction = resolved.value();
    transactions_.idempotency().remember(
        idempotency_key, Operation::kResolveDispute,
        transaction::IdempotentReply{.transaction = result.transaction, .dispute = result.dispute.id});
  }

  count(telemetry::Metric::kDisputesResolved);
  ESCROWCORE_LOG_INFO(kComponent, "dispute " << result.dispute.id << " resolved "
                                             << to_string(result.dispute.status) << " by moderator " << resolver.id);
  emit(events::EventType::kDisputeResolved, result.dispute, resolver, to_string(DisputeStatus::kOpen));
  return result;
}

common::Outcome<Dispute> DisputeResolver::escalate(common::DisputeId id) {
  Dispute escalated;
  {
    std::scoped_lock lock(mutex_);
    auto it = disputes_.find(id);
    if (it == disputes_.end()) {
      return ErrorCode::kNotFound;
    }
    auto& dispute = it->second;
    if (!dispute.open()) {
      return ErrorCode::kAlreadyResolved;
    }
    if (dispute.escalated) {
      return dispute;
    }
    dispute.escalated = true;
    dispute.escalated_at = clock_.now();
    escalated = dispute;
  }

  count(telemetry::Metric::kDisputesEscalated);
  ESCROWCORE_LOG_WARN(kComponent, "dispute " << id << " on transaction " << escalated.transaction
                                             << " escalated past its resolution window");
  emit(events::EventType::kDisputeEscalated, escalated, common::Actor::system(), to_string(escalated.status));
  return escalated;
}

common::Outcome<Dispute> DisputeResolver::get(common::DisputeId id) const {
  std::scoped_lock lock(mutex_);
  auto it = disputes_.find(id);
  if (it == disputes_.end()) {
    return ErrorCode::kNotFound;
  }
  return it->second;
}

std::optional<Dispute> DisputeResolver::for_transaction(common::TransactionId transaction) const {
  std::scoped_lock lock(mutex_);
  auto it = by_transaction_.find(transaction);
  if (it == by_transaction_.end()) {
    return std::nullopt;
  }
  return disputes_.at(it->second);
}

std::vector<Dispute> DisputeResolver::overdue(common::TimestampNs now, std::chrono::nanoseconds sla) const {
  std::scoped_lock lock(mutex_);
  std::vector<Dispute> result;
  for (const auto& [id, dispute] : disputes_) {
    if (dispute.open() && !dispute.escalated && dispute.opened_at + common::to_ns(sla) <= now) {
      result.push_back(dispute);
    }
  }
  return result;
}

}  // namespace dispute
}  // namespace escrowcore
