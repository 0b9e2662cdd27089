#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "escrowcore/common/types.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"

namespace escrowcore {
namespace events {

enum class EventType : std::uint8_t {
  kTransactionStatusChanged,
  kDisputeOpened,
  kDisputeResolved,
  kDisputeEscalated,
};

[[nodiscard]] std::string_view to_string(EventType type) noexcept;

struct Event {
  common::SequenceId sequence{0};
  EventType type{EventType::kTransactionStatusChanged};
  common::TransactionId transaction{0};
  std::string from_status{};
  std::string to_status{};
  common::DisputeId dispute{0};
  common::Actor actor{};
  common::TimestampNs timestamp{0};

  // Consumers deduplicate redelivered events by this key.
  [[nodiscard]] std::string dedup_key() const;
};

using SubscriberId = std::uint64_t;
using Subscriber = std::function<void(const Event&)>;

struct PublisherOptions {
  std::size_t history_limit{1000};
};

// In-process outbox. Every published event is stored and handed to each
// subscriber; a subscriber that throws keeps the event pending until a later
// redeliver() succeeds. Delivery is at-least-once.
class EventPublisher {
 public:
  explicit EventPublisher(PublisherOptions options = {}, telemetry::TelemetrySink* telemetry = nullptr);

  SubscriberId subscribe(Subscriber subscriber);
  void unsubscribe(SubscriberId id);

  // Assigns the sequence, stores the event and delivers it.
  Event publish(Event event);
  // Retries pending deliveries; returns how many succeeded.
  std::size_t redeliver();

  [[nodiscard]] std::vector<Event> history() const;
  [[nodiscard]] std::size_t pending() const;

 private:
  struct Outbound {
    Event event{};
    std::set<SubscriberId> pending{};
  };

  // Delivers outside the lock; subscribers may publish or query.
  std::set<SubscriberId> deliver(const Event& event, const std::set<SubscriberId>& targets);
  void record_failure(std::set<SubscriberId>& failed, SubscriberId id, const Event& event, std::string_view what);
  void trim_history();

  PublisherOptions options_;
  telemetry::TelemetrySink* telemetry_;

  mutable std::mutex mutex_;
  std::map<SubscriberId, Subscriber> subscribers_{};
  SubscriberId next_subscriber_{1};
  common::SequenceId next_sequence_{1};
  // Keyed by sequence so redelivery preserves publish order.
  std::map<common::SequenceId, Outbound> outbox_{};
  std::deque<Event> history_{};
};

}  // namespace events
}  // namespace escrowcore
