#include "escrowcore/sweeper/timeout_sweeper.hpp"

#include <exception>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace sweeper {

namespace {

constexpr std::string_view kComponent = "sweeper";

using transaction::TransactionStatus;

bool past(common::TimestampNs started, std::chrono::nanoseconds window, common::TimestampNs now) {
  return started != 0 && started + common::to_ns(window) <= now;
}

}  // namespace

std::string_view to_string(TimeoutPolicy policy) noexcept {
  switch (policy) {
    case TimeoutPolicy::kAutoRelease:
      return "auto_release";
    case TimeoutPolicy::kAutoRefund:
      return "auto_refund";
  }
  return "unknown";
}

TimeoutSweeper::TimeoutSweeper(transaction::TransactionEngine& transactions, dispute::DisputeResolver& disputes,
                               hold::HoldManager& holds, events::EventPublisher& events, const common::Clock& clock,
                               SweepPolicy policy, telemetry::TelemetrySink* telemetry)
    : transactions_(transactions),
      disputes_(disputes),
      holds_(holds),
      events_(events),
      clock_(clock),
      policy_(policy),
      telemetry_(telemetry) {}

TimeoutSweeper::~TimeoutSweeper() {
  stop();
}

void TimeoutSweeper::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  ESCROWCORE_LOG_INFO(kComponent, "starting, interval "
                                      << std::chrono::duration_cast<std::chrono::seconds>(policy_.interval).count()
                                      << "s, timeout policy " << to_string(policy_.timeout_policy));
  worker_ = std::thread(&TimeoutSweeper::sweep_loop, this);
}

void TimeoutSweeper::stop() {
  {
    std::scoped_lock lock(mutex_);
    running_.store(false, std::memory_order_release);
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
    ESCROWCORE_LOG_INFO(kComponent, "stopped");
  }
}

void TimeoutSweeper::sweep_loop() {
  while (running_.load(std::memory_order_acquire)) {
    try {
      const auto report = run_once();
      if (report.actions() > 0 || report.failures > 0) {
        ESCROWCORE_LOG_INFO(kComponent, "sweep: " << report.actions() << " actions, " << report.failures
                                                  << " failures");
      }
    } catch (const std::exception& ex) {
      ESCROWCORE_LOG_ERROR(kComponent, "sweep aborted: " << ex.what());
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, policy_.interval, [this] { return !running_.load(std::memory_order_acquire); });
  }
}

SweepReport TimeoutSweeper::run_once() {
  return run_once(clock_.now());
}

SweepReport TimeoutSweeper::run_once(common::TimestampNs now) {
  std::scoped_lock lock(sweep_mutex_);
  telemetry::ScopedLatency latency(telemetry_, "sweeper.run_once");
  SweepReport report;

  sweep_escrow(now, report);
  sweep_payments(now, report);
  sweep_pending(now, report);
  sweep_disputes(now, report);
  sweep_holds(now, report);

  report.events_redelivered = events_.redeliver();
  report.idempotency_purged = transactions_.idempotency().purge_expired();

  if (telemetry_ && report.actions() > 0) {
    telemetry_->increment(telemetry::Metric::kSweeperActions, static_cast<std::int64_t>(report.actions()));
  }
  return report;
}

void TimeoutSweeper::sweep_escrow(common::TimestampNs now, SweepReport& report) {
  const auto actor = common::Actor::system();
  for (const auto& txn : transactions_.list_by_status(TransactionStatus::kEscrowHeld)) {
    if (!past(txn.escrow_held_at, policy_.delivery_confirmation, now) || txn.dispute != 0) {
      continue;
    }
    const bool release = policy_.timeout_policy == TimeoutPolicy::kAutoRelease;
    auto result = common::retry_with_backoff(
        [&] {
          return release ? transactions_.confirm_delivery(txn.id, actor) : transactions_.refund(txn.id, actor);
        },
        policy_.retry);
    if (result) {
      ++(release ? report.auto_released : report.auto_refunded);
    } else if (result.error() != common::ErrorCode::kInvalidStateTransition) {
      // InvalidStateTransition: a caller acted on it first.
      ++report.failures;
      ESCROWCORE_LOG_WARN(kComponent, "delivery timeout on transaction " << txn.id << " failed: "
                                                                         << common::to_string(result.error()));
    }
  }
}

void TimeoutSweeper::sweep_payments(common::TimestampNs now, SweepReport& report) {
  const auto actor = common::Actor::system();
  for (const auto& txn : transactions_.list_by_status(TransactionStatus::kPaymentProcessing)) {
    if (!past(txn.payment_started_at, policy_.payment_processing, now)) {
      continue;
    }
    auto result = common::retry_with_backoff([&] { return transactions_.cancel(txn.id, actor); }, policy_.retry);
    if (result) {
      ++report.payments_canceled;
    } else if (result.error() != common::ErrorCode::kInvalidStateTransition) {
      ++report.failures;
      ESCROWCORE_LOG_WARN(kComponent, "payment timeout on transaction " << txn.id << " failed: "
                                                                        << common::to_string(result.error()));
    }
  }
}

void TimeoutSweeper::sweep_pending(common::TimestampNs now, SweepReport& report) {
  const auto actor = common::Actor::system();
  for (const auto& txn : transactions_.list_by_status(TransactionStatus::kPending)) {
    if (!past(txn.created_at, policy_.pending_expiry, now)) {
      continue;
    }
    auto result = common::retry_with_backoff([&] { return transactions_.cancel(txn.id, actor); }, policy_.retry);
    if (result) {
      ++report.pending_canceled;
    } else if (result.error() != common::ErrorCode::kInvalidStateTransition) {
      ++report.failures;
      ESCROWCORE_LOG_WARN(kComponent, "pending expiry on transaction " << txn.id << " failed: "
                                                                       << common::to_string(result.error()));
    }
  }
}

void TimeoutSweeper::sweep_disputes(common::TimestampNs now, SweepReport& report) {
  for (const auto& dispute : disputes_.overdue(now, policy_.dispute_sla)) {
    auto result = disputes_.escalate(dispute.id);
    if (result) {
      ++report.disputes_escalated;
    } else if (result.error() != common::ErrorCode::kAlreadyResolved) {
      ++report.failures;
    }
  }
}

void TimeoutSweeper::sweep_holds(common::TimestampNs now, SweepReport& report) {
  const auto actor = common::Actor::system();
  for (const auto& hold : holds_.expired_active(now)) {
    auto txn = transactions_.get(hold.transaction);
    if (txn && (txn->status == TransactionStatus::kEscrowHeld || txn->status == TransactionStatus::kDisputed)) {
      // Still backing escrow; delivery timeout or dispute resolution settles it.
      continue;
    }
    auto result =
        common::retry_with_backoff([&] { return holds_.expire_hold(hold.id, actor); }, policy_.retry);
    if (result) {
      ++report.holds_expired;
    } else if (result.error() != common::ErrorCode::kHoldNotActive) {
      ++report.failures;
      ESCROWCORE_LOG_WARN(kComponent, "expiring hold " << hold.id << " failed: "
                                                       << common::to_string(result.error()));
    }
  }
}

}  // namespace sweeper
}  // namespace escrowcore
