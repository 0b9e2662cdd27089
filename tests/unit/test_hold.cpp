#include "test_hold.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

#include "test_support.hpp"

namespace escrowcore::tests {

using common::ErrorCode;

void test_hold_place_and_capture() {
  EscrowFixture fx;
  const auto buyer = fx.funded_wallet(kBuyer, 10'000);
  const auto seller = fx.funded_wallet(kSeller, 0);

  auto hold = fx.holds.place_hold(buyer, 1, 8'000, std::chrono::minutes(15));
  assert(hold && hold->active());
  assert(hold->currency == "USD");
  assert(fx.available(buyer) == 2'000);
  assert(fx.held_balance(buyer) == 8'000);
  assert(fx.holds.active_for_transaction(1)->id == hold->id);

  assert(fx.holds.place_hold(buyer, 1, 100, std::chrono::minutes(15)).error() == ErrorCode::kDuplicateHold);
  assert(fx.holds.place_hold(buyer, 2, 0, std::chrono::minutes(15)).error() == ErrorCode::kInvalidAmount);
  assert(fx.holds.place_hold(buyer, 3, 5'000, std::chrono::minutes(15)).error() == ErrorCode::kInsufficientFunds);

  assert(fx.holds.capture_hold(hold->id, seller, 8'001).error() == ErrorCode::kInvalidAmount);

  auto captured = fx.holds.capture_hold(hold->id, seller, 400);
  assert(captured && captured->status == hold::HoldStatus::kCaptured);
  assert(captured->captured_amount == 8'000 && captured->fee == 400);
  assert(fx.held_balance(buyer) == 0);
  assert(fx.available(seller) == 7'600);

  auto fee_wallet = fx.holds.fee_wallet("USD");
  assert(fee_wallet && fx.available(*fee_wallet) == 400);
  assert(!fx.holds.active_for_transaction(1));

  // A hold leaves kActive exactly once.
  assert(fx.holds.release_hold(hold->id, 1.0).error() == ErrorCode::kHoldNotActive);
  assert(fx.holds.capture_hold(hold->id, seller, 0).error() == ErrorCode::kHoldNotActive);
  assert(fx.ledger.total_balance("USD") == 10'000);
  assert(fx.telemetry.counter(telemetry::Metric::kHoldsPlaced) == 1);
  assert(fx.telemetry.counter(telemetry::Metric::kHoldsCaptured) == 1);
}

void test_hold_partial_release() {
  EscrowFixture fx;
  const auto buyer = fx.funded_wallet(kBuyer, 10'000);
  const auto seller = fx.funded_wallet(kSeller, 0);

  auto hold = fx.holds.place_hold(buyer, 5, 10'000, std::chrono::minutes(15));
  assert(hold);
  assert(fx.holds.release_hold(hold->id, 0.0).error() == ErrorCode::kInvalidAmount);
  assert(fx.holds.release_hold(hold->id, 1.5).error() == ErrorCode::kInvalidAmount);

  auto partial = fx.holds.release_hold(hold->id, 0.25);
  assert(partial && partial->active());
  assert(partial->released_amount == 2'500 && partial->remaining() == 7'500);
  assert(fx.available(buyer) == 2'500 && fx.held_balance(buyer) == 7'500);
  assert(fx.holds.release_hold(hold->id, 0.5).error() == ErrorCode::kHoldNotActive);

  auto captured = fx.holds.capture_hold(hold->id, seller, 375);
  assert(captured && captured->released_amount == 2'500 && captured->captured_amount == 7'500);
  assert(fx.available(seller) == 7'125);
  assert(fx.held_balance(buyer) == 0);
  assert(fx.ledger.total_balance("USD") == 10'000);
}

void test_hold_concurrent_placement() {
  EscrowFixture fx;
  const auto buyer = fx.funded_wallet(kBuyer, 100'000);

  std::atomic<int> placed{0};
  std::atomic<int> duplicates{0};
  std::vector<std::thread> racers;
  for (int i = 0; i < 8; ++i) {
    racers.emplace_back([&] {
      auto hold = fx.holds.place_hold(buyer, 77, 1'000, std::chrono::minutes(15));
      if (hold) {
        ++placed;
      } else {
        assert(hold.error() == ErrorCode::kDuplicateHold);
        ++duplicates;
      }
    });
  }
  for (auto& racer : racers) {
    racer.join();
  }

  assert(placed == 1);
  assert(duplicates == 7);
  assert(fx.held_balance(buyer) == 1'000);
  assert(fx.ledger.entries(buyer).size() == 2);
}

void test_hold_expiry() {
  EscrowFixture fx;
  const auto buyer = fx.funded_wallet(kBuyer, 5'000);

  auto hold = fx.holds.place_hold(buyer, 9, 3'000, std::chrono::minutes(15));
  assert(hold);
  assert(fx.holds.expired_active(fx.clock.now()).empty());

  fx.clock.advance(std::chrono::minutes(16));
  const auto expired = fx.holds.expired_active(fx.clock.now());
  assert(expired.size() == 1 && expired.front().id == hold->id);

  assert(fx.holds.expire_hold(hold->id, common::Actor::user(kBuyer)).error() == ErrorCode::kForbidden);
  auto done = fx.holds.expire_hold(hold->id, common::Actor::system());
  assert(done && done->status == hold::HoldStatus::kExpired);
  assert(fx.available(buyer) == 5'000 && fx.held_balance(buyer) == 0);
  assert(fx.holds.expired_active(fx.clock.now()).empty());
  assert(fx.holds.expire_hold(hold->id, common::Actor::system()).error() == ErrorCode::kHoldNotActive);
}

void test_hold_split_single_posting() {
  EscrowFixture fx;
  const auto buyer = fx.funded_wallet(kBuyer, 10'000);
  const auto seller = fx.funded_wallet(kSeller, 0);
  auto hold = fx.holds.place_hold(buyer, 11, 10'000, std::chrono::minutes(15));
  assert(hold);
  const auto entries_before = fx.ledger.entries(buyer).size();

  assert(fx.holds.split_hold(hold->id, 1.0, seller, 0).error() == ErrorCode::kInvalidAmount);
  assert(fx.holds.split_hold(hold->id, 0.5, seller, 5'001).error() == ErrorCode::kInvalidAmount);

  // The buyer's share must not move when the seller's leg is refused.
  assert(fx.ledger.set_status(seller, ledger::WalletStatus::kBlocked));
  assert(fx.holds.split_hold(hold->id, 0.3, seller, 350).error() == ErrorCode::kWalletUnavailable);
  auto untouched = fx.holds.get(hold->id);
  assert(untouched->active() && untouched->released_amount == 0);
  assert(fx.available(buyer) == 0 && fx.held_balance(buyer) == 10'000);
  assert(fx.ledger.entries(buyer).size() == entries_before);
  assert(fx.available(seller) == 0);

  assert(fx.ledger.set_status(seller, ledger::WalletStatus::kActive));
  auto split = fx.holds.split_hold(hold->id, 0.3, seller, 350);
  assert(split && split->status == hold::HoldStatus::kCaptured);
  assert(split->released_amount == 3'000 && split->captured_amount == 7'000 && split->fee == 350);
  assert(fx.available(buyer) == 3'000 && fx.held_balance(buyer) == 0);
  assert(fx.available(seller) == 6'650);
  assert(fx.available(*fx.holds.fee_wallet("USD")) == 350);
  assert(fx.holds.split_hold(hold->id, 0.3, seller, 350).error() == ErrorCode::kHoldNotActive);
  assert(fx.ledger.total_balance("USD") == 10'000);

  // A buyer share that floors to zero sends everything to the seller.
  auto tiny = fx.holds.place_hold(seller, 12, 1, std::chrono::minutes(15));
  assert(tiny);
  const auto payer_available = fx.available(seller);
  auto all_to_payout = fx.holds.split_hold(tiny->id, 0.5, buyer, 0);
  assert(all_to_payout && all_to_payout->released_amount == 0 && all_to_payout->captured_amount == 1);
  assert(fx.available(seller) == payer_available && fx.held_balance(seller) == 0);
  assert(fx.available(buyer) == 3'001);
  assert(fx.ledger.reconcile(seller)->consistent());
}

void test_hold_extension() {
  EscrowFixture fx;
  const auto buyer = fx.funded_wallet(kBuyer, 5'000);
  auto hold = fx.holds.place_hold(buyer, 13, 2'000, std::chrono::minutes(15));
  assert(hold);
  const auto placed_expiry = hold->expires_at;

  fx.clock.advance(std::chrono::minutes(10));
  auto extended = fx.holds.extend_hold(hold->id, std::chrono::minutes(30));
  assert(extended && extended->expires_at == fx.clock.now() + common::to_ns(std::chrono::minutes(30)));
  assert(extended->expires_at > placed_expiry);

  // A shorter ttl never pulls the expiry back.
  auto shorter = fx.holds.extend_hold(hold->id, std::chrono::minutes(1));
  assert(shorter && shorter->expires_at == extended->expires_at);

  fx.clock.advance(std::chrono::minutes(10));
  assert(fx.holds.expired_active(fx.clock.now()).empty());
  fx.clock.advance(std::chrono::minutes(21));
  assert(fx.holds.expired_active(fx.clock.now()).size() == 1);

  assert(fx.holds.extend_hold(hold->id, std::chrono::nanoseconds::zero()).error() == ErrorCode::kInvalidAmount);
  assert(fx.holds.extend_hold(999, std::chrono::minutes(5)).error() == ErrorCode::kNotFound);
  assert(fx.holds.release_hold(hold->id, 1.0));
  assert(fx.holds.extend_hold(hold->id, std::chrono::minutes(5)).error() == ErrorCode::kHoldNotActive);
  assert(fx.available(buyer) == 5'000);
}

}  // namespace escrowcore::tests
