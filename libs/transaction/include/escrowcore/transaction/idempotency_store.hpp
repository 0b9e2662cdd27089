#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "escrowcore/common/error.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/common/types.hpp"
#include "escrowcore/hold/hold_manager.hpp"
#include "escrowcore/transaction/transaction_types.hpp"

namespace escrowcore {
namespace transaction {

enum class Operation : std::uint8_t {
  kCreate,
  kInitiatePayment,
  kConfirmDelivery,
  kCancel,
  kRefund,
  kOpenDispute,
  kResolveDispute,
};

[[nodiscard]] std::string_view to_string(Operation operation) noexcept;

// What a successful call returned, replayed verbatim on retry.
struct IdempotentReply {
  Transaction transaction{};
  std::optional<hold::Hold> hold{};
  std::optional<common::DisputeId> dispute{};
};

// Idempotency keys bound to (operation, transaction). Only successful
// replies are recorded, so a failed call may be retried with the same key.
class IdempotencyStore {
 public:
  explicit IdempotencyStore(const common::Clock& clock, std::chrono::nanoseconds ttl = std::chrono::hours(24 * 7));

  // nullopt: key unused. IdempotencyConflict: key bound to another operation
  // or transaction. `transaction` 0 matches any (used by create).
  [[nodiscard]] std::optional<common::Outcome<IdempotentReply>> lookup(const std::string& key, Operation operation,
                                                                       common::TransactionId transaction) const;
  void remember(const std::string& key, Operation operation, const IdempotentReply& reply);

  // Drops records older than the ttl; returns how many were removed.
  std::size_t purge_expired();
  [[nodiscard]] std::size_t size() const;

 private:
  struct Record {
    Operation operation{Operation::kCreate};
    common::TransactionId transaction{0};
    IdempotentReply reply{};
    common::TimestampNs expires_at{0};
  };

  const common::Clock& clock_;
  std::chrono::nanoseconds ttl_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Record> records_{};
};

}  // namespace transaction
}  // namespace escrowcore
