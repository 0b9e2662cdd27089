#include "escrowcore/transaction/idempotency_store.hpp"

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace transaction {

std::string_view to_string(Operation operation) noexcept {
  switch (operation) {
    case Operation::kCreate:
      return "create";
    case Operation::kInitiatePayment:
      return "initiate_payment";
    case Operation::kConfirmDelivery:
      return "confirm_delivery";
    case Operation::kCancel:
      return "cancel";
    case Operation::kRefund:
      return "refund";
    case Operation::kOpenDispute:
      return "open_dispute";
    case Operation::kResolveDispute:
      return "resolve_dispute";
  }
  return "unknown";
}

IdempotencyStore::IdempotencyStore(const common::Clock& clock, std::chrono::nanoseconds ttl)
    : clock_(clock), ttl_(ttl) {}

std::optional<common::Outcome<IdempotentReply>> IdempotencyStore::lookup(const std::string& key, Operation operation,
                                                                         common::TransactionId transaction) const {
  std::scoped_lock lock(mutex_);
  auto it = records_.find(key);
  if (it == records_.end() || it->second.expires_at <= clock_.now()) {
    return std::nullopt;
  }
  const auto& record = it->second;
  if (record.operation != operation || (transaction != 0 && record.transaction != transaction)) {
    ESCROWCORE_LOG_WARN("idempotency", "key '" << key << "' reused for " << to_string(operation)
                                               << " on transaction " << transaction << ", bound to "
                                               << to_string(record.operation) << " on " << record.transaction);
    return common::Outcome<IdempotentReply>(common::ErrorCode::kIdempotencyConflict);
  }
  return common::Outcome<IdempotentReply>(record.reply);
}

void IdempotencyStore::remember(const std::string& key, Operation operation, const IdempotentReply& reply) {
  if (key.empty()) {
    return;
  }
  std::scoped_lock lock(mutex_);
  records_.insert_or_assign(key, Record{
                                     .operation = operation,
                                     .transaction = reply.transaction.id,
                                     .reply = reply,
                                     .expires_at = clock_.now() + common::to_ns(ttl_),
                                 });
}

std::size_t IdempotencyStore::purge_expired() {
  const auto now = clock_.now();
  std::scoped_lock lock(mutex_);
  std::size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.expires_at <= now) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t IdempotencyStore::size() const {
  std::scoped_lock lock(mutex_);
  return records_.size();
}

}  // namespace transaction
}  // namespace escrowcore
