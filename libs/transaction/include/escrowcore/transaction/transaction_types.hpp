#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "escrowcore/common/types.hpp"

namespace escrowcore {
namespace transaction {

enum class TransactionStatus : std::uint8_t {
  kPending,
  kPaymentProcessing,
  kEscrowHeld,
  kCompleted,
  kCanceled,
  kRefunded,
  kDisputed,
  kResolvedBuyer,
  kResolvedSeller,
  kResolvedSplit,
};

[[nodiscard]] std::string_view to_string(TransactionStatus status) noexcept;

[[nodiscard]] constexpr bool is_terminal(TransactionStatus status) noexcept {
  switch (status) {
    case TransactionStatus::kCompleted:
    case TransactionStatus::kCanceled:
    case TransactionStatus::kRefunded:
    case TransactionStatus::kResolvedBuyer:
    case TransactionStatus::kResolvedSeller:
    case TransactionStatus::kResolvedSplit:
      return true;
    default:
      return false;
  }
}

// The single transition table. PAYMENT_PROCESSING -> PENDING is the rollback
// taken when the hold cannot be placed.
[[nodiscard]] constexpr bool can_transition(TransactionStatus from, TransactionStatus to) noexcept {
  using S = TransactionStatus;
  switch (from) {
    case S::kPending:
      return to == S::kPaymentProcessing || to == S::kCanceled;
    case S::kPaymentProcessing:
      return to == S::kEscrowHeld || to == S::kPending || to == S::kCanceled || to == S::kDisputed;
    case S::kEscrowHeld:
      return to == S::kCompleted || to == S::kRefunded || to == S::kDisputed;
    case S::kDisputed:
      return to == S::kResolvedBuyer || to == S::kResolvedSeller || to == S::kResolvedSplit;
    case S::kCompleted:
    case S::kCanceled:
    case S::kRefunded:
    case S::kResolvedBuyer:
    case S::kResolvedSeller:
    case S::kResolvedSplit:
      return false;
  }
  return false;
}

struct Transaction {
  common::TransactionId id{0};
  std::string listing_ref{};
  common::UserId buyer{0};
  common::UserId seller{0};
  common::Amount amount{0};
  common::Currency currency{};
  common::Amount fee{0};
  TransactionStatus status{TransactionStatus::kPending};
  common::TimestampNs created_at{0};
  common::TimestampNs updated_at{0};
  common::TimestampNs payment_started_at{0};
  common::TimestampNs escrow_held_at{0};
  common::TimestampNs closed_at{0};
  common::WalletId buyer_wallet{0};
  common::HoldId hold{0};
  common::DisputeId dispute{0};
  std::string payment_key{};

  [[nodiscard]] bool is_party(common::UserId user) const noexcept { return user == buyer || user == seller; }
};

struct HistoryEvent {
  common::TransactionId transaction{0};
  // Empty for the creation event.
  std::optional<TransactionStatus> from{};
  TransactionStatus to{TransactionStatus::kPending};
  common::Actor actor{};
  std::string reason{};
  common::TimestampNs timestamp{0};
};

enum class Action : std::uint8_t {
  kInitiatePayment,
  kConfirmDelivery,
  kCancel,
  kRefund,
  kOpenDispute,
  kResolveDispute,
};

[[nodiscard]] std::string_view to_string(Action action) noexcept;

enum class PartyRole : std::uint8_t {
  kAny,
  kBuyer,
  kSeller,
};

struct PartyFilter {
  common::UserId user{0};
  PartyRole role{PartyRole::kAny};
  std::optional<TransactionStatus> status{};
  std::size_t limit{100};
};

}  // namespace transaction
}  // namespace escrowcore
