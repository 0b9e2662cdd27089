#include "test_dispute.hpp"

#include <cassert>
#include <chrono>

#include "test_support.hpp"

namespace escrowcore::tests {

using common::Actor;
using common::ErrorCode;
using dispute::Resolution;
using transaction::TransactionStatus;

void test_dispute_split_resolution() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto txn = fx.held(buyer_wallet, 10'000);

  auto opened = fx.disputes.open(
      {.transaction = txn.id, .reason = "item damaged", .evidence_refs = {"photo-1", "photo-2"}},
      Actor::user(kBuyer));
  assert(opened && opened->open());
  assert(opened->evidence_refs.size() == 2);
  assert(fx.engine.get(txn.id)->status == TransactionStatus::kDisputed);
  assert(fx.engine.get(txn.id)->dispute == opened->id);

  auto resolved = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kSplit, .split_ratio = 0.5, .note = "both at fault"},
      Actor::user(kModerator));
  assert(resolved);
  assert(resolved->transaction.status == TransactionStatus::kResolvedSplit);
  assert(resolved->dispute.status == dispute::DisputeStatus::kResolvedSplit);
  assert(resolved->dispute.split_ratio == 0.5);
  assert(resolved->dispute.resolver == kModerator);

  const auto seller_wallet = *fx.ledger.find(kSeller, "USD");
  const auto fee_wallet = *fx.holds.fee_wallet("USD");
  assert(fx.available(buyer_wallet) == 5'000);
  assert(fx.held_balance(buyer_wallet) == 0);
  assert(fx.available(seller_wallet) == 4'750);
  assert(fx.available(fee_wallet) == 250);
  assert(fx.ledger.total_balance("USD") == 10'000);

  auto hold = fx.holds.get(txn.hold);
  assert(hold->status == hold::HoldStatus::kCaptured);
  assert(hold->released_amount == 5'000);
  assert(hold->captured_amount == 5'000);
}

void test_dispute_split_failure_moves_nothing() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto seller_wallet = fx.funded_wallet(kSeller, 0);
  const auto txn = fx.held(buyer_wallet, 10'000);
  auto opened = fx.disputes.open({.transaction = txn.id, .reason = "partial", .evidence_refs = {}},
                                 Actor::user(kBuyer));
  assert(opened);
  const auto history_before = fx.engine.history(txn.id)->size();

  assert(fx.ledger.set_status(seller_wallet, ledger::WalletStatus::kBlocked));
  auto refused = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kSplit, .split_ratio = 0.5, .note = {}},
      Actor::user(kModerator));
  assert(refused.error() == ErrorCode::kWalletUnavailable);
  assert(fx.engine.get(txn.id)->status == TransactionStatus::kDisputed);
  assert(fx.engine.history(txn.id)->size() == history_before);
  assert(fx.disputes.get(opened->id)->open());
  assert(fx.available(buyer_wallet) == 0 && fx.held_balance(buyer_wallet) == 10'000);
  auto hold = fx.holds.get(txn.hold);
  assert(hold->active() && hold->released_amount == 0);

  // Nothing moved, so the moderator is free to decide differently.
  assert(fx.ledger.set_status(seller_wallet, ledger::WalletStatus::kActive));
  auto resolved = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kSplit, .split_ratio = 0.9, .note = {}},
      Actor::user(kModerator));
  assert(resolved);
  assert(resolved->dispute.split_ratio == 0.9);
  assert(fx.available(buyer_wallet) == 9'000);
  assert(fx.available(seller_wallet) == 950);
  assert(fx.available(*fx.holds.fee_wallet("USD")) == 50);
  assert(fx.ledger.total_balance("USD") == 10'000);
}

void test_dispute_resume_after_settlement() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto seller_wallet = fx.funded_wallet(kSeller, 0);
  const auto txn = fx.held(buyer_wallet, 10'000);
  auto opened = fx.disputes.open({.transaction = txn.id, .reason = "partial", .evidence_refs = {}},
                                 Actor::user(kBuyer));
  assert(opened);

  // Funds already settled as a half split when the resolve was interrupted.
  assert(fx.holds.split_hold(txn.hold, 0.5, seller_wallet, 250));

  auto other_ratio = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kSplit, .split_ratio = 0.7, .note = {}},
      Actor::user(kModerator));
  assert(other_ratio.error() == ErrorCode::kInvalidStateTransition);
  auto other_outcome = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kBuyer, .split_ratio = 0.0, .note = {}},
      Actor::user(kModerator));
  assert(other_outcome.error() == ErrorCode::kInvalidStateTransition);
  assert(fx.disputes.get(opened->id)->open());

  auto resumed = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kSplit, .split_ratio = 0.5, .note = {}},
      Actor::user(kModerator));
  assert(resumed);
  assert(resumed->transaction.status == TransactionStatus::kResolvedSplit);
  assert(resumed->dispute.split_ratio == 0.5);
  assert(fx.available(buyer_wallet) == 5'000);
  assert(fx.available(seller_wallet) == 4'750);
  assert(fx.ledger.total_balance("USD") == 10'000);
}

void test_dispute_buyer_resolution() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto txn = fx.held(buyer_wallet, 6'000);

  auto opened = fx.disputes.open({.transaction = txn.id, .reason = "never arrived", .evidence_refs = {}},
                                 Actor::user(kBuyer), "dispute-key");
  assert(opened);
  auto replayed = fx.disputes.open({.transaction = txn.id, .reason = "never arrived", .evidence_refs = {}},
                                   Actor::user(kBuyer), "dispute-key");
  assert(replayed && replayed->id == opened->id);

  auto resolved = fx.disputes.resolve({.dispute = opened->id, .resolution = Resolution::kBuyer, .split_ratio = 0.0,
                                       .note = "refund"},
                                      Actor::user(kModerator), "resolve-key");
  assert(resolved);
  assert(resolved->transaction.status == TransactionStatus::kResolvedBuyer);
  assert(resolved->dispute.split_ratio == 1.0);
  assert(fx.available(buyer_wallet) == 10'000);
  assert(fx.held_balance(buyer_wallet) == 0);
  assert(fx.holds.get(txn.hold)->status == hold::HoldStatus::kReleased);

  // Retried with its key the resolution replays; without it the dispute is closed.
  auto again = fx.disputes.resolve({.dispute = opened->id, .resolution = Resolution::kBuyer, .split_ratio = 0.0,
                                    .note = "refund"},
                                   Actor::user(kModerator), "resolve-key");
  assert(again && again->dispute.id == opened->id);
  auto closed = fx.disputes.resolve({.dispute = opened->id, .resolution = Resolution::kSeller, .split_ratio = 0.0,
                                     .note = {}},
                                    Actor::user(kModerator));
  assert(closed.error() == ErrorCode::kAlreadyResolved);
}

void test_dispute_seller_resolution() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto txn = fx.held(buyer_wallet, 2'000);

  auto opened = fx.disputes.open({.transaction = txn.id, .reason = "buyer claims", .evidence_refs = {}},
                                 Actor::user(kSeller));
  assert(opened);
  auto resolved = fx.disputes.resolve(
      {.dispute = opened->id, .resolution = Resolution::kSeller, .split_ratio = 0.0, .note = "delivered"},
      Actor::user(kModerator));
  assert(resolved && resolved->transaction.status == TransactionStatus::kResolvedSeller);
  assert(fx.available(*fx.ledger.find(kSeller, "USD")) == 1'900);
  assert(fx.available(*fx.holds.fee_wallet("USD")) == 100);
  assert(fx.available(buyer_wallet) == 8'000);
}

void test_dispute_rules() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto pending = fx.create(1'000);
  const auto txn = fx.held(buyer_wallet, 1'000);

  const dispute::OpenRequest request{.transaction = txn.id, .reason = "r", .evidence_refs = {}};
  assert(fx.disputes.open(request, Actor::user(303)).error() == ErrorCode::kForbidden);
  assert(fx.disputes.open(request, Actor::system()).error() == ErrorCode::kForbidden);
  assert(fx.disputes.open({.transaction = pending.id, .reason = "r", .evidence_refs = {}}, Actor::user(kBuyer))
             .error() == ErrorCode::kInvalidStateTransition);

  auto opened = fx.disputes.open(request, Actor::user(kBuyer));
  assert(opened);
  assert(fx.disputes.open(request, Actor::user(kSeller)).error() == ErrorCode::kAlreadyDisputed);
  assert(fx.disputes.for_transaction(txn.id)->id == opened->id);

  dispute::ResolveRequest resolve{.dispute = opened->id, .resolution = Resolution::kSplit, .split_ratio = 1.0,
                                  .note = {}};
  assert(fx.disputes.resolve(resolve, Actor::user(kBuyer)).error() == ErrorCode::kForbidden);
  assert(fx.disputes.resolve(resolve, Actor::system()).error() == ErrorCode::kForbidden);
  assert(fx.disputes.resolve(resolve, Actor::user(kModerator)).error() == ErrorCode::kInvalidAmount);
  resolve.split_ratio = 0.0;
  assert(fx.disputes.resolve(resolve, Actor::user(kModerator)).error() == ErrorCode::kInvalidAmount);
  resolve.dispute = 77;
  resolve.split_ratio = 0.5;
  assert(fx.disputes.resolve(resolve, Actor::user(kModerator)).error() == ErrorCode::kNotFound);

  // Once disputed, the parties can no longer settle directly.
  assert(fx.engine.confirm_delivery(txn.id, Actor::user(kBuyer)).error() == ErrorCode::kInvalidStateTransition);
  assert(fx.engine.refund(txn.id, Actor::user(kSeller)).error() == ErrorCode::kInvalidStateTransition);
  assert(fx.held_balance(buyer_wallet) == 1'000);
}

void test_dispute_escalation() {
  EscrowFixture fx;
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 10'000);
  const auto txn = fx.held(buyer_wallet, 1'000);

  auto opened = fx.disputes.open({.transaction = txn.id, .reason = "r", .evidence_refs = {}}, Actor::user(kBuyer));
  assert(opened);
  const auto sla = std::chrono::hours(24 * 7);
  assert(fx.disputes.overdue(fx.clock.now(), sla).empty());

  fx.clock.advance(sla + std::chrono::minutes(1));
  auto overdue = fx.disputes.overdue(fx.clock.now(), sla);
  assert(overdue.size() == 1);

  auto escalated = fx.disputes.escalate(opened->id);
  assert(escalated && escalated->escalated && escalated->open());
  auto repeat = fx.disputes.escalate(opened->id);
  assert(repeat && repeat->escalated_at == escalated->escalated_at);
  assert(fx.disputes.overdue(fx.clock.now(), sla).empty());
  assert(fx.telemetry.counter(telemetry::Metric::kDisputesEscalated) == 1);

  std::size_t escalation_events = 0;
  for (const auto& event : fx.events.history()) {
    if (event.type == events::EventType::kDisputeEscalated) {
      ++escalation_events;
      assert(event.actor.is_system());
      assert(event.dedup_key() == std::to_string(txn.id) + ":dispute:escalated");
    }
  }
  assert(escalation_events == 1);
  assert(fx.held_balance(buyer_wallet) == 1'000);
}

}  // namespace escrowcore::tests
