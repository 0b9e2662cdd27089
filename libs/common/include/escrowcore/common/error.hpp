#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace escrowcore {
namespace common {

enum class ErrorCode : std::uint16_t {
  kNone = 0,
  kInvalidAmount = 1001,
  kInsufficientFunds = 1002,
  kInvalidStateTransition = 1003,
  kDuplicateHold = 1004,
  kHoldNotActive = 1005,
  kAlreadyDisputed = 1006,
  kAlreadyResolved = 1007,
  kForbidden = 1008,
  kNotFound = 1009,
  kStoreUnavailable = 1010,
  kSameParty = 1011,
  kUnsupportedCurrency = 1012,
  kCurrencyMismatch = 1013,
  kWalletUnavailable = 1014,
  kIdempotencyConflict = 1015,
  kDeadlineExceeded = 1016,
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

// Message safe to show an end user. Role and state violations collapse to a
// single generic message so internal status names never leak.
[[nodiscard]] std::string_view user_message(ErrorCode code) noexcept;

// Transient infrastructure failures that a caller may retry with backoff.
[[nodiscard]] constexpr bool is_retryable(ErrorCode code) noexcept {
  return code == ErrorCode::kStoreUnavailable || code == ErrorCode::kDeadlineExceeded;
}

template <typename T>
class Outcome {
 public:
  Outcome(T value) : value_(std::move(value)) {}
  Outcome(ErrorCode error) : error_(error) {}

  [[nodiscard]] bool ok() const noexcept { return error_ == ErrorCode::kNone; }
  explicit operator bool() const noexcept { return ok(); }
  [[nodiscard]] ErrorCode error() const noexcept { return error_; }

  [[nodiscard]] const T& value() const& { return *value_; }
  [[nodiscard]] T& value() & { return *value_; }
  [[nodiscard]] T&& value() && { return std::move(*value_); }
  const T* operator->() const { return &*value_; }
  T* operator->() { return &*value_; }
  const T& operator*() const& { return *value_; }

 private:
  std::optional<T> value_{};
  ErrorCode error_{ErrorCode::kNone};
};

}  // namespace common
}  // namespace escrowcore
