#include "test_events.hpp"

#include <cassert>
#include <stdexcept>
#include <vector>

#include "escrowcore/events/event_publisher.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"
#include "test_support.hpp"

namespace escrowcore::tests {

namespace {

events::Event status_event(common::TransactionId txn, const char* from, const char* to) {
  return events::Event{
      .type = events::EventType::kTransactionStatusChanged,
      .transaction = txn,
      .from_status = from,
      .to_status = to,
      .actor = common::Actor::user(1),
  };
}

}  // namespace

void test_event_delivery_and_redelivery() {
  telemetry::TelemetrySink telemetry;
  events::EventPublisher publisher({}, &telemetry);

  std::vector<std::string> steady;
  std::vector<std::string> flaky_seen;
  bool flaky_down = true;
  publisher.subscribe([&](const events::Event& event) { steady.push_back(event.dedup_key()); });
  publisher.subscribe([&](const events::Event& event) {
    if (flaky_down) {
      throw std::runtime_error("broker unavailable");
    }
    flaky_seen.push_back(event.dedup_key());
  });

  auto first = publisher.publish(status_event(5, "PENDING", "PAYMENT_PROCESSING"));
  auto second = publisher.publish(status_event(5, "PAYMENT_PROCESSING", "ESCROW_HELD"));
  assert(first.sequence == 1 && second.sequence == 2);
  assert(first.dedup_key() == "5:PAYMENT_PROCESSING");
  assert(events::to_string(first.type) == "transaction.status_changed");

  assert(steady.size() == 2);
  assert(publisher.pending() == 2);
  assert(telemetry.counter(telemetry::Metric::kEventDeliveryFailures) == 2);

  // Still down: nothing delivered, nothing lost.
  assert(publisher.redeliver() == 0);
  assert(publisher.pending() == 2);

  flaky_down = false;
  assert(publisher.redeliver() == 2);
  assert(publisher.pending() == 0);
  assert((flaky_seen == std::vector<std::string>{"5:PAYMENT_PROCESSING", "5:ESCROW_HELD"}));
  // The healthy subscriber is not redelivered to.
  assert(steady.size() == 2);

  auto history = publisher.history();
  assert(history.size() == 2);
  assert(history.front().sequence == 1 && history.back().sequence == 2);
  assert(telemetry.counter(telemetry::Metric::kEventsPublished) == 2);
}

void test_event_history_limit() {
  events::EventPublisher publisher(events::PublisherOptions{.history_limit = 3});
  for (common::TransactionId txn = 1; txn <= 5; ++txn) {
    publisher.publish(status_event(txn, "", "PENDING"));
  }
  auto history = publisher.history();
  assert(history.size() == 3);
  assert(history.front().transaction == 3);
  assert(history.back().sequence == 5);

  // Events waiting on a subscriber are kept regardless of the cap.
  auto id = publisher.subscribe([](const events::Event&) { throw std::runtime_error("down"); });
  for (common::TransactionId txn = 6; txn <= 10; ++txn) {
    publisher.publish(status_event(txn, "", "PENDING"));
  }
  assert(publisher.pending() == 5);
  assert(publisher.history().size() == 8);

  publisher.unsubscribe(id);
  assert(publisher.pending() == 0);
  assert(publisher.history().size() == 3);
}

void test_event_non_standard_throw() {
  EscrowFixture fx;
  bool down = true;
  std::size_t delivered = 0;
  fx.events.subscribe([&](const events::Event&) {
    if (down) {
      throw 42;
    }
    ++delivered;
  });

  // Both the direct publish on create and the queued publish on unlock survive it.
  const auto buyer_wallet = fx.funded_wallet(kBuyer, 5'000);
  const auto txn = fx.held(buyer_wallet, 1'000);
  assert(fx.engine.get(txn.id)->status == transaction::TransactionStatus::kEscrowHeld);
  assert(fx.events.pending() == 3);
  assert(fx.telemetry.counter(telemetry::Metric::kEventDeliveryFailures) == 3);

  down = false;
  assert(fx.events.redeliver() == 3);
  assert(fx.events.pending() == 0);
  assert(delivered == 3);
}

}  // namespace escrowcore::tests
