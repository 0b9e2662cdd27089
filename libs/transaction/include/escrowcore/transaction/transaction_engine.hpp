#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "escrowcore/auth/capability_registry.hpp"
#include "escrowcore/common/error.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/common/types.hpp"
#include "escrowcore/events/event_publisher.hpp"
#include "escrowcore/hold/hold_manager.hpp"
#include "escrowcore/ledger/ledger_store.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"
#include "escrowcore/transaction/idempotency_store.hpp"
#include "escrowcore/transaction/transaction_types.hpp"

namespace escrowcore {
namespace transaction {

struct CreateRequest {
  common::UserId buyer{0};
  common::UserId seller{0};
  std::string listing_ref{};
  common::Amount amount{0};
  common::Currency currency{};
};

struct PaymentResult {
  Transaction transaction{};
  hold::Hold hold{};
};

struct EngineOptions {
  std::int32_t fee_basis_points{500};
  std::chrono::nanoseconds hold_ttl{std::chrono::minutes(15)};
};

// Owns transaction lifecycle. Every status change goes through one checked
// transition that appends history and publishes transaction.status_changed.
// Operations on one transaction serialize on its lock; the loser of a race
// observes the winner's status and fails InvalidStateTransition.
class TransactionEngine {
 private:
  struct Slot {
    mutable std::timed_mutex mutex;
    Transaction state{};
    std::vector<HistoryEvent> history{};
  };

 public:
  // Exclusive access to one transaction. Status events queued while locked
  // are published after the lock is released.
  class Locked {
   public:
    Locked(Locked&& other) noexcept;
    Locked& operator=(Locked&&) = delete;
    Locked(const Locked&) = delete;
    Locked& operator=(const Locked&) = delete;
    ~Locked();

    [[nodiscard]] const Transaction& transaction() const noexcept { return slot_->state; }

   private:
    friend class TransactionEngine;
    Locked(TransactionEngine* engine, Slot* slot, std::unique_lock<std::timed_mutex> lock);

    TransactionEngine* engine_;
    Slot* slot_;
    std::unique_lock<std::timed_mutex> lock_;
    std::vector<events::Event> queued_{};
  };

  TransactionEngine(ledger::LedgerStore& ledger, hold::HoldManager& holds, events::EventPublisher& events,
                    IdempotencyStore& idempotency, const common::Clock& clock, EngineOptions options = {},
                    const auth::CapabilityRegistry* capabilities = nullptr,
                    telemetry::TelemetrySink* telemetry = nullptr);
  TransactionEngine(const TransactionEngine&) = delete;
  TransactionEngine& operator=(const TransactionEngine&) = delete;

  common::Outcome<Transaction> create(const CreateRequest& request, const std::string& idempotency_key = {},
                                      common::Deadline deadline = common::no_deadline());
  common::Outcome<PaymentResult> initiate_payment(common::TransactionId id, common::WalletId wallet,
                                                  const common::Actor& actor, const std::string& idempotency_key = {},
                                                  common::Deadline deadline = common::no_deadline());
  common::Outcome<Transaction> confirm_delivery(common::TransactionId id, const common::Actor& actor,
                                                const std::string& idempotency_key = {},
                                                common::Deadline deadline = common::no_deadline());
  common::Outcome<Transaction> cancel(common::TransactionId id, const common::Actor& actor,
                                      const std::string& idempotency_key = {},
                                      common::Deadline deadline = common::no_deadline());
  common::Outcome<Transaction> refund(common::TransactionId id, const common::Actor& actor,
                                      const std::string& idempotency_key = {},
                                      common::Deadline deadline = common::no_deadline());

  [[nodiscard]] common::Outcome<Transaction> get(common::TransactionId id) const;
  [[nodiscard]] std::vector<Transaction> list_by_party(const PartyFilter& filter) const;
  [[nodiscard]] std::vector<Transaction> list_by_status(TransactionStatus status) const;
  [[nodiscard]] common::Outcome<std::vector<HistoryEvent>> history(common::TransactionId id) const;
  [[nodiscard]] common::Outcome<std::vector<Action>> available_actions(common::TransactionId id,
                                                                       const common::Actor& actor) const;

  [[nodiscard]] common::Amount fee_for(common::Amount amount) const noexcept;

  // Building blocks for collaborators that drive transitions themselves.
  common::Outcome<Locked> acquire(common::TransactionId id, common::Deadline deadline);
  common::Outcome<Transaction> transition(Locked& locked, TransactionStatus to, const common::Actor& actor,
                                          std::string_view reason);
  void attach_dispute(Locked& locked, common::DisputeId dispute);
  void reject(common::ErrorCode code);

  [[nodiscard]] IdempotencyStore& idempotency() noexcept { return idempotency_; }
  [[nodiscard]] hold::HoldManager& holds() noexcept { return holds_; }
  [[nodiscard]] ledger::LedgerStore& ledger() noexcept { return ledger_; }
  [[nodiscard]] telemetry::TelemetrySink* telemetry() const noexcept { return telemetry_; }

 private:
  ledger::LedgerStore& ledger_;
  hold::HoldManager& holds_;
  events::EventPublisher& events_;
  IdempotencyStore& idempotency_;
  const common::Clock& clock_;
  EngineOptions options_;
  const auth::CapabilityRegistry* capabilities_;
  telemetry::TelemetrySink* telemetry_;

  mutable std::shared_mutex mutex_;
  std::map<common::TransactionId, std::unique_ptr<Slot>> transactions_;
  std::atomic<common::TransactionId> next_id_{1};
  // Serializes keyed create() calls so a retried key yields one transaction.
  std::timed_mutex create_mutex_;

  Slot* find_slot(common::TransactionId id) const;
  void publish(std::vector<events::Event>& queued);

  template <typename T>
  common::Outcome<T> fail(common::ErrorCode code) {
    reject(code);
    return code;
  }
};

}  // namespace transaction
}  // namespace escrowcore
