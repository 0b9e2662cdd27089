#include "escrowcore/events/event_publisher.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace events {

namespace {

constexpr std::string_view kComponent = "events";

}  // namespace

std::string_view to_string(EventType type) noexcept {
  switch (type) {
    case EventType::kTransactionStatusChanged:
      return "transaction.status_changed";
    case EventType::kDisputeOpened:
      return "dispute.opened";
    case EventType::kDisputeResolved:
      return "dispute.resolved";
    case EventType::kDisputeEscalated:
      return "dispute.escalated";
  }
  return "unknown";
}

std::string Event::dedup_key() const {
  return std::to_string(transaction) + ":" + to_status;
}

EventPublisher::EventPublisher(PublisherOptions options, telemetry::TelemetrySink* telemetry)
    : options_(options), telemetry_(telemetry) {}

SubscriberId EventPublisher::subscribe(Subscriber subscriber) {
  std::scoped_lock lock(mutex_);
  const auto id = next_subscriber_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void EventPublisher::unsubscribe(SubscriberId id) {
  std::scoped_lock lock(mutex_);
  subscribers_.erase(id);
  for (auto it = outbox_.begin(); it != outbox_.end();) {
    it->second.pending.erase(id);
    if (it->second.pending.empty()) {
      history_.push_back(it->second.event);
      it = outbox_.erase(it);
    } else {
      ++it;
    }
  }
  trim_history();
}

std::set<SubscriberId> EventPublisher::deliver(const Event& event, const std::set<SubscriberId>& targets) {
  std::set<SubscriberId> failed;
  for (const auto id : targets) {
    Subscriber subscriber;
    {
      std::scoped_lock lock(mutex_);
      auto it = subscribers_.find(id);
      if (it == subscribers_.end()) {
        continue;
      }
      subscriber = it->second;
    }
    try {
      subscriber(event);
    } catch (const std::exception& ex) {
      record_failure(failed, id, event, ex.what());
    } catch (...) {
      // Subscribers run on engine paths that must not unwind.
      record_failure(failed, id, event, "non-standard exception");
    }
  }
  return failed;
}

void EventPublisher::record_failure(std::set<SubscriberId>& failed, SubscriberId id, const Event& event,
                                    std::string_view what) {
  failed.insert(id);
  if (telemetry_) {
    telemetry_->increment(telemetry::Metric::kEventDeliveryFailures);
  }
  ESCROWCORE_LOG_WARN(kComponent, "subscriber " << id << " failed on " << to_string(event.type) << " #"
                                                << event.sequence << ": " << what);
}

void EventPublisher::trim_history() {
  while (history_.size() > options_.history_limit) {
    history_.pop_front();
  }
}

Event EventPublisher::publish(Event event) {
  std::set<SubscriberId> targets;
  {
    std::scoped_lock lock(mutex_);
    event.sequence = next_sequence_++;
    for (const auto& [id, subscriber] : subscribers_) {
      targets.insert(id);
    }
    outbox_.emplace(event.sequence, Outbound{.event = event, .pending = targets});
  }
  if (telemetry_) {
    telemetry_->increment(telemetry::Metric::kEventsPublished);
  }
  ESCROWCORE_LOG_DEBUG(kComponent, to_string(event.type) << " #" << event.sequence << " transaction="
                                                         << event.transaction << " " << event.from_status << " -> "
                                                         << event.to_status);

  const auto failed = deliver(event, targets);

  std::scoped_lock lock(mutex_);
  auto it = outbox_.find(event.sequence);
  if (it != outbox_.end()) {
    // Keep only failures; unsubscribe may have pruned the set meanwhile.
    std::set<SubscriberId> still_pending;
    for (const auto id : failed) {
      if (it->second.pending.count(id) != 0) {
        still_pending.insert(id);
      }
    }
    it->second.pending = std::move(still_pending);
    if (it->second.pending.empty()) {
      history_.push_back(it->second.event);
      outbox_.erase(it);
      trim_history();
    }
  }
  return event;
}

std::size_t EventPublisher::redeliver() {
  std::vector<Outbound> batch;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& [sequence, outbound] : outbox_) {
      if (!outbound.pending.empty()) {
        batch.push_back(outbound);
      }
    }
  }

  std::size_t delivered = 0;
  for (const auto& outbound : batch) {
    const auto failed = deliver(outbound.event, outbound.pending);
    delivered += outbound.pending.size() - failed.size();

    std::scoped_lock lock(mutex_);
    auto it = outbox_.find(outbound.event.sequence);
    if (it == outbox_.end()) {
      continue;
    }
    for (const auto id : outbound.pending) {
      if (failed.count(id) == 0) {
        it->second.pending.erase(id);
      }
    }
    if (it->second.pending.empty()) {
      history_.push_back(it->second.event);
      outbox_.erase(it);
      trim_history();
    }
  }
  if (!batch.empty()) {
    ESCROWCORE_LOG_DEBUG(kComponent, "redelivered " << delivered << " pending deliveries");
  }
  return delivered;
}

std::vector<Event> EventPublisher::history() const {
  std::scoped_lock lock(mutex_);
  std::vector<Event> events(history_.begin(), history_.end());
  for (const auto& [sequence, outbound] : outbox_) {
    events.push_back(outbound.event);
  }
  std::sort(events.begin(), events.end(),
            [](const Event& lhs, const Event& rhs) { return lhs.sequence < rhs.sequence; });
  return events;
}

std::size_t EventPublisher::pending() const {
  std::scoped_lock lock(mutex_);
  std::size_t count = 0;
  for (const auto& [sequence, outbound] : outbox_) {
    count += outbound.pending.size();
  }
  return count;
}

}  // namespace events
}  // namespace escrowcore
