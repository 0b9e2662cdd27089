#include "escrowcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace escrowcore {
namespace telemetry {

std::string_view to_string(Metric metric) noexcept {
  switch (metric) {
    case Metric::kTransitions:
      return "transitions";
    case Metric::kTransactionsCreated:
      return "transactions_created";
    case Metric::kHoldsPlaced:
      return "holds_placed";
    case Metric::kHoldsCaptured:
      return "holds_captured";
    case Metric::kHoldsReleased:
      return "holds_released";
    case Metric::kHoldsExpired:
      return "holds_expired";
    case Metric::kDisputesOpened:
      return "disputes_opened";
    case Metric::kDisputesResolved:
      return "disputes_resolved";
    case Metric::kDisputesEscalated:
      return "disputes_escalated";
    case Metric::kRejectedCalls:
      return "rejected_calls";
    case Metric::kIdempotentReplays:
      return "idempotent_replays";
    case Metric::kSweeperActions:
      return "sweeper_actions";
    case Metric::kEventsPublished:
      return "events_published";
    case Metric::kEventDeliveryFailures:
      return "event_delivery_failures";
    case Metric::kCount:
      break;
  }
  return "unknown";
}

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target && cumulative > 0) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  if (!enabled_ || metric == Metric::kCount) {
    return;
  }
  std::scoped_lock lock(mutex_);
  counters_[static_cast<std::size_t>(metric)] += delta;
}

void TelemetrySink::record_latency(std::string_view operation, std::chrono::nanoseconds latency) {
  if (!enabled_) {
    return;
  }
  std::scoped_lock lock(mutex_);
  auto it = histograms_.find(operation);
  if (it == histograms_.end()) {
    it = histograms_.emplace(std::string(operation), StreamingHistogram{}).first;
  }
  it->second.record(latency.count());
}

std::int64_t TelemetrySink::counter(Metric metric) const {
  if (metric == Metric::kCount) {
    return 0;
  }
  std::scoped_lock lock(mutex_);
  return counters_[static_cast<std::size_t>(metric)];
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  std::vector<Sample> samples;
  for (std::size_t idx = 0; idx < counters_.size(); ++idx) {
    if (counters_[idx] == 0) {
      continue;
    }
    samples.push_back(Sample{.metric = static_cast<Metric>(idx), .value = counters_[idx]});
    counters_[idx] = 0;
  }
  return samples;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;
  for (auto& [operation, hist] : histograms_) {
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(Summary{
        .operation = operation,
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });
    hist.reset();
  }
  return summaries;
}

}  // namespace telemetry
}  // namespace escrowcore
