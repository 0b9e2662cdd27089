#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "escrowcore/auth/capability_registry.hpp"
#include "escrowcore/common/error.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/common/types.hpp"
#include "escrowcore/events/event_publisher.hpp"
#include "escrowcore/hold/hold_manager.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"
#include "escrowcore/transaction/transaction_engine.hpp"

namespace escrowcore {
namespace dispute {

enum class DisputeStatus : std::uint8_t {
  kOpen,
  kResolvedBuyer,
  kResolvedSeller,
  kResolvedSplit,
};

enum class Resolution : std::uint8_t {
  kBuyer,
  kSeller,
  kSplit,
};

[[nodiscard]] std::string_view to_string(DisputeStatus status) noexcept;
[[nodiscard]] std::string_view to_string(Resolution resolution) noexcept;

struct Dispute {
  common::DisputeId id{0};
  common::TransactionId transaction{0};
  common::UserId opener{0};
  std::string reason{};
  std::vector<std::string> evidence_refs{};
  DisputeStatus status{DisputeStatus::kOpen};
  std::string resolution_note{};
  // Share of the held amount returned to the buyer.
  double split_ratio{0.0};
  common::TimestampNs opened_at{0};
  common::TimestampNs resolved_at{0};
  common::UserId resolver{0};
  bool escalated{false};
  common::TimestampNs escalated_at{0};

  [[nodiscard]] bool open() const noexcept { return status == DisputeStatus::kOpen; }
};

struct OpenRequest {
  common::TransactionId transaction{0};
  std::string reason{};
  std::vector<std::string> evidence_refs{};
};

struct ResolveRequest {
  common::DisputeId dispute{0};
  Resolution resolution{Resolution::kBuyer};
  double split_ratio{0.0};
  std::string note{};
};

struct ResolveResult {
  Dispute dispute{};
  transaction::Transaction transaction{};
};

// Dispute lifecycle. Funds move only through the hold manager, and every
// decision runs under the disputed transaction's lock.
class DisputeResolver {
 public:
  DisputeResolver(transaction::TransactionEngine& transactions, events::EventPublisher& events,
                  const auth::CapabilityRegistry& capabilities, const common::Clock& clock,
                  telemetry::TelemetrySink* telemetry = nullptr);
  DisputeResolver(const DisputeResolver&) = delete;
  DisputeResolver& operator=(const DisputeResolver&) = delete;

  common::Outcome<Dispute> open(const OpenRequest& request, const common::Actor& opener,
                                const std::string& idempotency_key = {},
                                common::Deadline deadline = common::no_deadline());
  // Requires the moderate capability.
  common::Outcome<ResolveResult> resolve(const ResolveRequest& request, const common::Actor& resolver,
                                         const std::string& idempotency_key = {},
                                         common::Deadline deadline = common::no_deadline());
  // Flags an open dispute for manual attention. Repeat calls are no-ops.
  common::Outcome<Dispute> escalate(common::DisputeId id);

  [[nodiscard]] common::Outcome<Dispute> get(common::DisputeId id) const;
  [[nodiscard]] std::optional<Dispute> for_transaction(common::TransactionId transaction) const;
  // Open, not yet escalated disputes opened at least `sla` before `now`.
  [[nodiscard]] std::vector<Dispute> overdue(common::TimestampNs now, std::chrono::nanoseconds sla) const;

 private:
  transaction::TransactionEngine& transactions_;
  events::EventPublisher& events_;
  const auth::CapabilityRegistry& capabilities_;
  const common::Clock& clock_;
  telemetry::TelemetrySink* telemetry_;

  mutable std::mutex mutex_;
  std::map<common::DisputeId, Dispute> disputes_{};
  std::unordered_map<common::TransactionId, common::DisputeId> by_transaction_{};
  common::DisputeId next_id_{1};

  // kNone once the hold reflects the resolution.
  common::ErrorCode settle_funds(const transaction::Transaction& txn, const ResolveRequest& request,
                                 common::Deadline deadline);
  // True when a hold that already left kActive carries this resolution.
  static bool settled_as(const hold::Hold& hold, const transaction::Transaction& txn,
                         const ResolveRequest& request);
  void emit(events::EventType type, const Dispute& dispute, const common::Actor& actor, std::string_view from);
  void count(telemetry::Metric metric);
};

}  // namespace dispute
}  // namespace escrowcore
