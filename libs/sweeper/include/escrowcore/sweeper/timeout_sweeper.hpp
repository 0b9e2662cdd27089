#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <thread>

#include "escrowcore/common/retry.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/dispute/dispute_resolver.hpp"
#include "escrowcore/events/event_publisher.hpp"
#include "escrowcore/hold/hold_manager.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"
#include "escrowcore/transaction/transaction_engine.hpp"

namespace escrowcore {
namespace sweeper {

// What happens to ESCROW_HELD transactions whose delivery window elapsed.
enum class TimeoutPolicy : std::uint8_t {
  kAutoRelease,
  kAutoRefund,
};

[[nodiscard]] std::string_view to_string(TimeoutPolicy policy) noexcept;

struct SweepPolicy {
  std::chrono::nanoseconds interval{std::chrono::seconds(60)};
  std::chrono::nanoseconds delivery_confirmation{std::chrono::hours(72)};
  std::chrono::nanoseconds payment_processing{std::chrono::minutes(15)};
  std::chrono::nanoseconds pending_expiry{std::chrono::hours(24)};
  std::chrono::nanoseconds dispute_sla{std::chrono::hours(24 * 7)};
  TimeoutPolicy timeout_policy{TimeoutPolicy::kAutoRelease};
  common::BackoffPolicy retry{};
};

struct SweepReport {
  std::size_t auto_released{0};
  std::size_t auto_refunded{0};
  std::size_t payments_canceled{0};
  std::size_t pending_canceled{0};
  std::size_t disputes_escalated{0};
  std::size_t holds_expired{0};
  std::size_t events_redelivered{0};
  std::size_t idempotency_purged{0};
  std::size_t failures{0};

  [[nodiscard]] std::size_t actions() const noexcept {
    return auto_released + auto_refunded + payments_canceled + pending_canceled + disputes_escalated + holds_expired;
  }
};

// Drives forced transitions for everything past its deadline, through the
// same operations callers use, acting as the system actor.
class TimeoutSweeper {
 public:
  TimeoutSweeper(transaction::TransactionEngine& transactions, dispute::DisputeResolver& disputes,
                 hold::HoldManager& holds, events::EventPublisher& events, const common::Clock& clock,
                 SweepPolicy policy = {}, telemetry::TelemetrySink* telemetry = nullptr);
  TimeoutSweeper(const TimeoutSweeper&) = delete;
  TimeoutSweeper& operator=(const TimeoutSweeper&) = delete;
  ~TimeoutSweeper();

  void start();
  void stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

  SweepReport run_once();
  SweepReport run_once(common::TimestampNs now);

 private:
  void sweep_loop();
  void sweep_escrow(common::TimestampNs now, SweepReport& report);
  void sweep_payments(common::TimestampNs now, SweepReport& report);
  void sweep_pending(common::TimestampNs now, SweepReport& report);
  void sweep_disputes(common::TimestampNs now, SweepReport& report);
  void sweep_holds(common::TimestampNs now, SweepReport& report);

  transaction::TransactionEngine& transactions_;
  dispute::DisputeResolver& disputes_;
  hold::HoldManager& holds_;
  events::EventPublisher& events_;
  const common::Clock& clock_;
  SweepPolicy policy_;
  telemetry::TelemetrySink* telemetry_;

  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex mutex_;
  std::condition_variable cv_;
  // Serializes run_once between the worker and direct callers.
  std::mutex sweep_mutex_;
};

}  // namespace sweeper
}  // namespace escrowcore
