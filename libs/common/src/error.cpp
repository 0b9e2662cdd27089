#include "escrowcore/common/error.hpp"

namespace escrowcore {
namespace common {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNone:
      return "ok";
    case ErrorCode::kInvalidAmount:
      return "invalid_amount";
    case ErrorCode::kInsufficientFunds:
      return "insufficient_funds";
    case ErrorCode::kInvalidStateTransition:
      return "invalid_state_transition";
    case ErrorCode::kDuplicateHold:
      return "duplicate_hold";
    case ErrorCode::kHoldNotActive:
      return "hold_not_active";
    case ErrorCode::kAlreadyDisputed:
      return "already_disputed";
    case ErrorCode::kAlreadyResolved:
      return "already_resolved";
    case ErrorCode::kForbidden:
      return "forbidden";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kStoreUnavailable:
      return "store_unavailable";
    case ErrorCode::kSameParty:
      return "same_party";
    case ErrorCode::kUnsupportedCurrency:
      return "unsupported_currency";
    case ErrorCode::kCurrencyMismatch:
      return "currency_mismatch";
    case ErrorCode::kWalletUnavailable:
      return "wallet_unavailable";
    case ErrorCode::kIdempotencyConflict:
      return "idempotency_conflict";
    case ErrorCode::kDeadlineExceeded:
      return "deadline_exceeded";
  }
  return "unknown";
}

std::string_view user_message(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kNone:
      return "";
    case ErrorCode::kInsufficientFunds:
      return "Insufficient funds. Top up your wallet and try again.";
    case ErrorCode::kInvalidAmount:
      return "The amount is not valid.";
    case ErrorCode::kSameParty:
      return "You cannot buy your own listing.";
    case ErrorCode::kUnsupportedCurrency:
    case ErrorCode::kCurrencyMismatch:
      return "This currency is not available for this payment.";
    case ErrorCode::kWalletUnavailable:
      return "This wallet cannot be used right now.";
    case ErrorCode::kNotFound:
      return "Not found.";
    case ErrorCode::kStoreUnavailable:
    case ErrorCode::kDeadlineExceeded:
      return "The service is busy. Please try again.";
    case ErrorCode::kInvalidStateTransition:
    case ErrorCode::kDuplicateHold:
    case ErrorCode::kHoldNotActive:
    case ErrorCode::kAlreadyDisputed:
    case ErrorCode::kAlreadyResolved:
    case ErrorCode::kForbidden:
    case ErrorCode::kIdempotencyConflict:
      return "This action is not available.";
  }
  return "This action is not available.";
}

}  // namespace common
}  // namespace escrowcore
