#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "escrowcore/common/error.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/common/types.hpp"
#include "escrowcore/ledger/ledger_store.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"

namespace escrowcore {
namespace hold {

enum class HoldStatus : std::uint8_t {
  kActive,
  kCaptured,
  kReleased,
  kExpired,
};

[[nodiscard]] std::string_view to_string(HoldStatus status) noexcept;

struct Hold {
  common::HoldId id{0};
  common::WalletId wallet{0};
  common::TransactionId transaction{0};
  common::Amount amount{0};
  common::Amount released_amount{0};
  common::Amount captured_amount{0};
  common::Amount fee{0};
  common::Currency currency{};
  HoldStatus status{HoldStatus::kActive};
  common::TimestampNs created_at{0};
  common::TimestampNs expires_at{0};
  common::TimestampNs resolved_at{0};

  [[nodiscard]] common::Amount remaining() const noexcept { return amount - released_amount - captured_amount; }
  [[nodiscard]] bool active() const noexcept { return status == HoldStatus::kActive; }
};

struct HoldOptions {
  // Owner of the per-currency platform fee wallets.
  common::UserId platform_owner{common::kSystemUserId};
};

// Funds earmarked for one transaction. All balance effects go through the
// ledger; the manager only tracks hold lifecycle. At most one active hold
// exists per transaction, and a hold leaves kActive exactly once.
class HoldManager {
 public:
  HoldManager(ledger::LedgerStore& ledger, const common::Clock& clock, HoldOptions options = {},
              telemetry::TelemetrySink* telemetry = nullptr);
  HoldManager(const HoldManager&) = delete;
  HoldManager& operator=(const HoldManager&) = delete;

  common::Outcome<Hold> place_hold(common::WalletId wallet, common::TransactionId transaction, common::Amount amount,
                                   std::chrono::nanoseconds ttl, common::Deadline deadline = common::no_deadline());

  // Pays the remaining amount minus `fee` into `payout_wallet` and `fee` into
  // the platform fee wallet, in one posting.
  common::Outcome<Hold> capture_hold(common::HoldId hold, common::WalletId payout_wallet, common::Amount fee,
                                     common::Deadline deadline = common::no_deadline());

  // fraction in (0, 1]. Below 1 the hold stays active with the remainder,
  // which must then be captured or released in full.
  common::Outcome<Hold> release_hold(common::HoldId hold, double fraction,
                                     common::Deadline deadline = common::no_deadline());

  // Returns floor(remaining * buyer_fraction) to the hold's wallet and pays
  // the rest minus `fee` to `payout_wallet`, plus `fee` to the platform, as
  // one posting. buyer_fraction in (0, 1). Fails HoldNotActive once any part
  // of the hold has been released.
  common::Outcome<Hold> split_hold(common::HoldId hold, double buyer_fraction, common::WalletId payout_wallet,
                                   common::Amount fee, common::Deadline deadline = common::no_deadline());

  // Pushes expires_at to now + ttl. Only an active hold can be extended, and
  // never to an earlier expiry.
  common::Outcome<Hold> extend_hold(common::HoldId hold, std::chrono::nanoseconds ttl,
                                    common::Deadline deadline = common::no_deadline());

  common::Outcome<Hold> expire_hold(common::HoldId hold, const common::Actor& actor,
                                    common::Deadline deadline = common::no_deadline());

  [[nodiscard]] common::Outcome<Hold> get(common::HoldId hold) const;
  [[nodiscard]] std::optional<Hold> active_for_transaction(common::TransactionId transaction) const;
  [[nodiscard]] std::vector<Hold> expired_active(common::TimestampNs now) const;

  common::Outcome<common::WalletId> fee_wallet(const common::Currency& currency);

 private:
  struct HoldSlot {
    mutable std::timed_mutex mutex;
    Hold state{};
  };

  ledger::LedgerStore& ledger_;
  const common::Clock& clock_;
  HoldOptions options_;
  telemetry::TelemetrySink* telemetry_;

  mutable std::shared_mutex mutex_;
  std::map<common::HoldId, std::unique_ptr<HoldSlot>> holds_;
  std::unordered_map<common::TransactionId, common::HoldId> active_by_transaction_;
  // Transactions with a placement in flight; guarded by mutex_.
  std::unordered_set<common::TransactionId> placing_;
  common::HoldId next_id_{1};

  HoldSlot* find_slot(common::HoldId hold) const;
  common::Outcome<common::Amount> add_payout_legs(ledger::Posting& posting, const Hold& hold,
                                                  common::WalletId payout_wallet, common::Amount payout,
                                                  common::Amount fee);
  void retire(const Hold& hold);
  void count(telemetry::Metric metric);

  static std::string ledger_ref(const Hold& hold, std::string_view suffix = {});
};

}  // namespace hold
}  // namespace escrowcore
