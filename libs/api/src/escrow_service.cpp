#include "escrowcore/api/escrow_service.hpp"

#include <utility>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace api {

namespace {

using common::ErrorCode;

}  // namespace

EscrowService::EscrowService(const common::Clock& clock, ServiceOptions options, ledger::Journal* journal)
    : clock_(clock),
      options_(std::move(options)),
      telemetry_(options_.telemetry_enabled),
      ledger_(clock_, journal, options_.ledger),
      holds_(ledger_, clock_, options_.holds, &telemetry_),
      events_(options_.events, &telemetry_),
      idempotency_(clock_, options_.idempotency_ttl),
      transactions_(ledger_, holds_, events_, idempotency_, clock_, options_.transactions, &capabilities_,
                    &telemetry_),
      disputes_(transactions_, events_, capabilities_, clock_, &telemetry_),
      sweeper_(transactions_, disputes_, holds_, events_, clock_, options_.sweeper, &telemetry_) {}

common::Deadline EscrowService::resolve(OptionalDeadline deadline) const {
  return deadline ? *deadline : common::deadline_after(options_.call_timeout);
}

template <typename T>
Reply<T> EscrowService::reply(common::Outcome<T> outcome) {
  if (!outcome) {
    return reject<T>(outcome.error());
  }
  return Reply<T>{.code = ErrorCode::kNone, .message = {}, .value = std::move(outcome).value()};
}

template <typename T>
Reply<T> EscrowService::reject(common::ErrorCode code) {
  return Reply<T>{.code = code, .message = common::user_message(code), .value = std::nullopt};
}

common::ErrorCode EscrowService::check_visible(const common::Actor& actor, const transaction::Transaction& txn) const {
  if (actor.is_system() || txn.is_party(actor.id) || capabilities_.has_capability(actor.id, auth::kModerate)) {
    return ErrorCode::kNone;
  }
  return ErrorCode::kNotFound;
}

common::ErrorCode EscrowService::check_wallet_owner(const common::Actor& actor, common::WalletId wallet) const {
  auto current = ledger_.get(wallet);
  if (!current) {
    return current.error();
  }
  if (!actor.is_system() && current->owner != actor.id) {
    return ErrorCode::kForbidden;
  }
  return ErrorCode::kNone;
}

Reply<ledger::Wallet> EscrowService::open_wallet(const common::Actor& actor, common::UserId owner,
                                                 const common::Currency& currency) {
  telemetry::ScopedLatency latency(&telemetry_, "api.open_wallet");
  if (!actor.is_system() && actor.id != owner) {
    return reject<ledger::Wallet>(ErrorCode::kForbidden);
  }
  return reply(ledger_.open_wallet(owner, currency));
}

Reply<ledger::Wallet> EscrowService::deposit(const common::Actor& actor, common::WalletId wallet,
                                             common::Amount amount, const std::string& reference,
                                             OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.deposit");
  if (const auto denied = check_wallet_owner(actor, wallet); denied != ErrorCode::kNone) {
    return reject<ledger::Wallet>(denied);
  }
  return reply(ledger_.deposit(wallet, amount, reference, resolve(deadline)));
}

Reply<ledger::Wallet> EscrowService::withdraw(const common::Actor& actor, common::WalletId wallet,
                                              common::Amount amount, const std::string& reference,
                                              OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.withdraw");
  if (const auto denied = check_wallet_owner(actor, wallet); denied != ErrorCode::kNone) {
    return reject<ledger::Wallet>(denied);
  }
  return reply(ledger_.withdraw(wallet, amount, reference, resolve(deadline)));
}

Reply<ledger::Wallet> EscrowService::get_wallet(const common::Actor& actor, common::WalletId wallet) {
  if (const auto denied = check_wallet_owner(actor, wallet); denied != ErrorCode::kNone) {
    // Someone else's wallet does not exist as far as the caller can tell.
    return reject<ledger::Wallet>(denied == ErrorCode::kForbidden ? ErrorCode::kNotFound : denied);
  }
  return reply(ledger_.get(wallet));
}

Reply<ledger::Wallet> EscrowService::set_wallet_status(const common::Actor& actor, common::WalletId wallet,
                                                       ledger::WalletStatus status) {
  if (!actor.is_system()) {
    return reject<ledger::Wallet>(ErrorCode::kForbidden);
  }
  return reply(ledger_.set_status(wallet, status));
}

Reply<transaction::Transaction> EscrowService::create_transaction(const common::Actor& actor,
                                                                  const transaction::CreateRequest& request,
                                                                  const std::string& idempotency_key,
                                                                  OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.create_transaction");
  if (!actor.is_system() && actor.id != request.buyer) {
    return reject<transaction::Transaction>(ErrorCode::kForbidden);
  }
  return reply(transactions_.create(request, idempotency_key, resolve(deadline)));
}

Reply<PaymentReply> EscrowService::initiate_payment(const common::Actor& actor, common::TransactionId id,
                                                    common::WalletId wallet, const std::string& idempotency_key,
                                                    OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.initiate_payment");
  auto paid = transactions_.initiate_payment(id, wallet, actor, idempotency_key, resolve(deadline));
  if (!paid) {
    return reject<PaymentReply>(paid.error());
  }
  return Reply<PaymentReply>{
      .code = ErrorCode::kNone,
      .message = {},
      .value = PaymentReply{.transaction = paid->transaction, .hold = paid->hold},
  };
}

Reply<transaction::Transaction> EscrowService::confirm_delivery(const common::Actor& actor, common::TransactionId id,
                                                                const std::string& idempotency_key,
                                                                OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.confirm_delivery");
  return reply(transactions_.confirm_delivery(id, actor, idempotency_key, resolve(deadline)));
}

Reply<dispute::Dispute> EscrowService::open_dispute(const common::Actor& actor, const dispute::OpenRequest& request,
                                                    const std::string& idempotency_key, OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.open_dispute");
  return reply(disputes_.open(request, actor, idempotency_key, resolve(deadline)));
}

Reply<dispute::ResolveResult> EscrowService::resolve_dispute(const common::Actor& actor,
                                                             const dispute::ResolveRequest& request,
                                                             const std::string& idempotency_key,
                                                             OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.resolve_dispute");
  return reply(disputes_.resolve(request, actor, idempotency_key, resolve(deadline)));
}

Reply<transaction::Transaction> EscrowService::cancel_transaction(const common::Actor& actor,
                                                                  common::TransactionId id,
                                                                  const std::string& idempotency_key,
                                                                  OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.cancel_transaction");
  return reply(transactions_.cancel(id, actor, idempotency_key, resolve(deadline)));
}

Reply<transaction::Transaction> EscrowService::refund_transaction(const common::Actor& actor,
                                                                  common::TransactionId id,
                                                                  const std::string& idempotency_key,
                                                                  OptionalDeadline deadline) {
  telemetry::ScopedLatency latency(&telemetry_, "api.refund_transaction");
  return reply(transactions_.refund(id, actor, idempotency_key, resolve(deadline)));
}

Reply<transaction::Transaction> EscrowService::get_transaction(const common::Actor& actor,
                                                               common::TransactionId id) {
  auto txn = transactions_.get(id);
  if (!txn) {
    return reject<transaction::Transaction>(txn.error());
  }
  if (const auto hidden = check_visible(actor, txn.value()); hidden != ErrorCode::kNone) {
    return reject<transaction::Transaction>(hidden);
  }
  return reply(std::move(txn));
}

Reply<std::vector<transaction::Transaction>> EscrowService::list_by_party(const common::Actor& actor,
                                                                          const transaction::PartyFilter& filter) {
  if (!actor.is_system() && actor.id != filter.user) {
    return reject<std::vector<transaction::Transaction>>(ErrorCode::kForbidden);
  }
  return Reply<std::vector<transaction::Transaction>>{
      .code = ErrorCode::kNone,
      .message = {},
      .value = transactions_.list_by_party(filter),
  };
}

Reply<std::vector<transaction::HistoryEvent>> EscrowService::get_history(const common::Actor& actor,
                                                                         common::TransactionId id) {
  auto txn = transactions_.get(id);
  if (!txn) {
    return reject<std::vector<transaction::HistoryEvent>>(txn.error());
  }
  if (const auto hidden = check_visible(actor, txn.value()); hidden != ErrorCode::kNone) {
    return reject<std::vector<transaction::HistoryEvent>>(hidden);
  }
  return reply(transactions_.history(id));
}

Reply<std::vector<transaction::Action>> EscrowService::available_actions(const common::Actor& actor,
                                                                         common::TransactionId id) {
  auto txn = transactions_.get(id);
  if (!txn) {
    return reject<std::vector<transaction::Action>>(txn.error());
  }
  if (const auto hidden = check_visible(actor, txn.value()); hidden != ErrorCode::kNone) {
    return reject<std::vector<transaction::Action>>(hidden);
  }
  return reply(transactions_.available_actions(id, actor));
}

}  // namespace api
}  // namespace escrowcore
