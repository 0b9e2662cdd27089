#pragma once

#include <cassert>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>

#include "escrowcore/auth/capability_registry.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/common/types.hpp"
#include "escrowcore/dispute/dispute_resolver.hpp"
#include "escrowcore/events/event_publisher.hpp"
#include "escrowcore/hold/hold_manager.hpp"
#include "escrowcore/ledger/journal.hpp"
#include "escrowcore/ledger/ledger_store.hpp"
#include "escrowcore/sweeper/timeout_sweeper.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"
#include "escrowcore/transaction/idempotency_store.hpp"
#include "escrowcore/transaction/transaction_engine.hpp"

namespace escrowcore::tests {

inline constexpr common::UserId kBuyer = 101;
inline constexpr common::UserId kSeller = 202;
inline constexpr common::UserId kModerator = 909;

// In-memory journal whose appends can be made to fail or to stall until
// resumed. A stalled append keeps the posting's wallet locks held.
class ControlledJournal final : public ledger::Journal {
 public:
  common::SequenceId append(ledger::JournalKind, std::span<const std::byte>) override {
    std::unique_lock lock(mutex_);
    ++stalled_appends_;
    cv_.notify_all();
    cv_.wait(lock, [this] { return !stalled_; });
    --stalled_appends_;
    if (failures_left_ > 0) {
      --failures_left_;
      throw std::runtime_error("journal device unavailable");
    }
    return ++sequence_;
  }

  [[nodiscard]] common::SequenceId last_sequence() const override {
    std::scoped_lock lock(mutex_);
    return sequence_;
  }

  void fail_next(int count) {
    std::scoped_lock lock(mutex_);
    failures_left_ = count;
  }

  void stall() {
    std::scoped_lock lock(mutex_);
    stalled_ = true;
  }

  void resume() {
    {
      std::scoped_lock lock(mutex_);
      stalled_ = false;
    }
    cv_.notify_all();
  }

  void wait_for_stalled_append() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return stalled_appends_ > 0; });
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  common::SequenceId sequence_{0};
  int failures_left_{0};
  int stalled_appends_{0};
  bool stalled_{false};
};

// The engine wired together in memory, on a manual clock.
struct EscrowFixture {
  common::ManualClock clock{};
  telemetry::TelemetrySink telemetry{};
  auth::CapabilityRegistry capabilities{};
  auth::SecretKey issuer_secret{};
  ControlledJournal journal{};
  ledger::LedgerStore ledger{clock, &journal};
  hold::HoldManager holds{ledger, clock, {}, &telemetry};
  events::EventPublisher events{{}, &telemetry};
  transaction::IdempotencyStore idempotency{clock};
  transaction::TransactionEngine engine{ledger, holds, events, idempotency, clock, {}, &capabilities, &telemetry};
  dispute::DisputeResolver disputes{engine, events, capabilities, clock, &telemetry};

  EscrowFixture() {
    auth::PublicKey issuer_public{};
    auth::CapabilityRegistry::generate_keypair(issuer_public, issuer_secret);
    capabilities.set_issuer(issuer_public);
    const bool granted =
        capabilities.register_grant(auth::CapabilityRegistry::issue(issuer_secret, kModerator, auth::kModerate));
    assert(granted);
    (void)granted;
  }

  common::WalletId funded_wallet(common::UserId owner, common::Amount amount, const std::string& currency = "USD") {
    auto wallet = ledger.open_wallet(owner, currency);
    assert(wallet);
    if (amount > 0) {
      auto deposited = ledger.deposit(wallet->id, amount, "seed-" + std::to_string(owner));
      assert(deposited);
    }
    return wallet->id;
  }

  transaction::Transaction create(common::Amount amount, const std::string& currency = "USD") {
    auto created = engine.create({.buyer = kBuyer,
                                  .seller = kSeller,
                                  .listing_ref = "listing-1",
                                  .amount = amount,
                                  .currency = currency});
    assert(created);
    return created.value();
  }

  // Creates a transaction and moves it to ESCROW_HELD from `wallet`.
  transaction::Transaction held(common::WalletId wallet, common::Amount amount) {
    const auto txn = create(amount);
    auto paid = engine.initiate_payment(txn.id, wallet, common::Actor::user(kBuyer));
    assert(paid);
    return paid->transaction;
  }

  common::Amount available(common::WalletId wallet) const {
    auto current = ledger.get(wallet);
    assert(current);
    return current->available;
  }

  common::Amount held_balance(common::WalletId wallet) const {
    auto current = ledger.get(wallet);
    assert(current);
    return current->held;
  }
};

}  // namespace escrowcore::tests
