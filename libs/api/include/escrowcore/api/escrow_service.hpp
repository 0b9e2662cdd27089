#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "escrowcore/auth/capability_registry.hpp"
#include "escrowcore/common/error.hpp"
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

namespace escrowcore {
namespace api {

// Every reply carries either the authoritative post-call object or an error
// code with its user-facing message.
template <typename T>
struct Reply {
  common::ErrorCode code{common::ErrorCode::kNone};
  std::string_view message{};
  std::optional<T> value{};

  [[nodiscard]] bool ok() const noexcept { return code == common::ErrorCode::kNone; }
};

struct PaymentReply {
  transaction::Transaction transaction{};
  hold::Hold hold{};
};

struct ServiceOptions {
  ledger::LedgerOptions ledger{};
  hold::HoldOptions holds{};
  transaction::EngineOptions transactions{};
  std::chrono::nanoseconds idempotency_ttl{std::chrono::hours(24 * 7)};
  events::PublisherOptions events{};
  sweeper::SweepPolicy sweeper{};
  bool telemetry_enabled{true};
  // Applied when a call passes no deadline of its own.
  std::chrono::milliseconds call_timeout{5000};
};

using OptionalDeadline = std::optional<common::Deadline>;

// The engine's external surface. Wires the components together and checks
// caller identity on wallet and read operations.
class EscrowService {
 public:
  EscrowService(const common::Clock& clock, ServiceOptions options = {}, ledger::Journal* journal = nullptr);
  EscrowService(const EscrowService&) = delete;
  EscrowService& operator=(const EscrowService&) = delete;

  Reply<ledger::Wallet> open_wallet(const common::Actor& actor, common::UserId owner, const common::Currency& currency);
  Reply<ledger::Wallet> deposit(const common::Actor& actor, common::WalletId wallet, common::Amount amount,
                                const std::string& reference, OptionalDeadline deadline = std::nullopt);
  Reply<ledger::Wallet> withdraw(const common::Actor& actor, common::WalletId wallet, common::Amount amount,
                                 const std::string& reference, OptionalDeadline deadline = std::nullopt);
  Reply<ledger::Wallet> get_wallet(const common::Actor& actor, common::WalletId wallet);
  Reply<ledger::Wallet> set_wallet_status(const common::Actor& actor, common::WalletId wallet,
                                          ledger::WalletStatus status);

  Reply<transaction::Transaction> create_transaction(const common::Actor& actor,
                                                     const transaction::CreateRequest& request,
                                                     const std::string& idempotency_key = {},
                                                     OptionalDeadline deadline = std::nullopt);
  Reply<PaymentReply> initiate_payment(const common::Actor& actor, common::TransactionId id, common::WalletId wallet,
                                       const std::string& idempotency_key = {},
                                       OptionalDeadline deadline = std::nullopt);
  Reply<transaction::Transaction> confirm_delivery(const common::Actor& actor, common::TransactionId id,
                                                   const std::string& idempotency_key = {},
                                                   OptionalDeadline deadline = std::nullopt);
  Reply<dispute::Dispute> open_dispute(const common::Actor& actor, const dispute::OpenRequest& request,
                                       const std::string& idempotency_key = {},
                                       OptionalDeadline deadline = std::nullopt);
  Reply<dispute::ResolveResult> resolve_dispute(const common::Actor& actor, const dispute::ResolveRequest& request,
                                                const std::string& idempotency_key = {},
                                                OptionalDeadline deadline = std::nullopt);
  Reply<transaction::Transaction> cancel_transaction(const common::Actor& actor, common::TransactionId id,
                                                     const std::string& idempotency_key = {},
                                                     OptionalDeadline deadline = std::nullopt);
  Reply<transaction::Transaction> refund_transaction(const common::Actor& actor, common::TransactionId id,
                                                     const std::string& idempotency_key = {},
                                                     OptionalDeadline deadline = std::nullopt);

  Reply<transaction::Transaction> get_transaction(const common::Actor& actor, common::TransactionId id);
  Reply<std::vector<transaction::Transaction>> list_by_party(const common::Actor& actor,
                                                             const transaction::PartyFilter& filter);
  Reply<std::vector<transaction::HistoryEvent>> get_history(const common::Actor& actor, common::TransactionId id);
  Reply<std::vector<transaction::Action>> available_actions(const common::Actor& actor, common::TransactionId id);

  [[nodiscard]] ledger::LedgerStore& ledger() noexcept { return ledger_; }
  [[nodiscard]] hold::HoldManager& holds() noexcept { return holds_; }
  [[nodiscard]] transaction::TransactionEngine& transactions() noexcept { return transactions_; }
  [[nodiscard]] dispute::DisputeResolver& disputes() noexcept { return disputes_; }
  [[nodiscard]] events::EventPublisher& events() noexcept { return events_; }
  [[nodiscard]] sweeper::TimeoutSweeper& sweeper() noexcept { return sweeper_; }
  [[nodiscard]] auth::CapabilityRegistry& capabilities() noexcept { return capabilities_; }
  [[nodiscard]] telemetry::TelemetrySink& telemetry() noexcept { return telemetry_; }

 private:
  common::Deadline resolve(OptionalDeadline deadline) const;
  // NotFound unless the actor may see the transaction.
  common::ErrorCode check_visible(const common::Actor& actor, const transaction::Transaction& txn) const;
  common::ErrorCode check_wallet_owner(const common::Actor& actor, common::WalletId wallet) const;

  template <typename T>
  Reply<T> reply(common::Outcome<T> outcome);
  template <typename T>
  Reply<T> reject(common::ErrorCode code);

  const common::Clock& clock_;
  ServiceOptions options_;

  telemetry::TelemetrySink telemetry_;
  auth::CapabilityRegistry capabilities_;
  ledger::LedgerStore ledger_;
  hold::HoldManager holds_;
  events::EventPublisher events_;
  transaction::IdempotencyStore idempotency_;
  transaction::TransactionEngine transactions_;
  dispute::DisputeResolver disputes_;
  sweeper::TimeoutSweeper sweeper_;
};

}  // namespace api
}  // namespace escrowcore
