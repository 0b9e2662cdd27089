#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "escrowcore/common/types.hpp"

namespace escrowcore {
namespace ledger {

enum class WalletStatus : std::uint8_t {
  kActive,
  kBlocked,
  kClosed,
};

enum class EntryReason : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kHold,
  kCapture,
  kRelease,
  kFee,
  kExpire,
};

struct Wallet {
  common::WalletId id{0};
  common::UserId owner{0};
  common::Currency currency{};
  common::Amount available{0};
  common::Amount held{0};
  WalletStatus status{WalletStatus::kActive};
  std::uint64_t version{0};

  [[nodiscard]] common::Amount total() const noexcept { return available + held; }
};

// `amount` is the net effect on available + held. Hold and release entries
// net to zero; their deltas carry the movement between the two buckets.
struct LedgerEntry {
  common::SequenceId sequence{0};
  common::WalletId wallet{0};
  common::Amount amount{0};
  common::Amount available_delta{0};
  common::Amount held_delta{0};
  common::Currency currency{};
  EntryReason reason{EntryReason::kDeposit};
  std::string txn_ref{};
  common::TimestampNs timestamp{0};
};

struct PostingLeg {
  common::WalletId wallet{0};
  common::Amount available_delta{0};
  common::Amount held_delta{0};
  EntryReason reason{EntryReason::kDeposit};
};

// A set of legs committed all-or-nothing under one txn reference.
struct Posting {
  std::string txn_ref{};
  std::vector<PostingLeg> legs{};
};

struct PostingResult {
  // True when every leg had already been committed earlier; nothing changed.
  bool duplicate{false};
  std::vector<LedgerEntry> entries{};
};

struct ReconcileReport {
  common::WalletId wallet{0};
  common::Amount cached_available{0};
  common::Amount cached_held{0};
  common::Amount derived_available{0};
  common::Amount derived_held{0};
  std::size_t entry_count{0};

  [[nodiscard]] bool consistent() const noexcept {
    return cached_available == derived_available && cached_held == derived_held;
  }
};

std::string_view to_string(WalletStatus status) noexcept;
std::string_view to_string(EntryReason reason) noexcept;

}  // namespace ledger
}  // namespace escrowcore
