#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace escrowcore {
namespace telemetry {

enum class Metric : std::uint16_t {
  kTransitions,
  kTransactionsCreated,
  kHoldsPlaced,
  kHoldsCaptured,
  kHoldsReleased,
  kHoldsExpired,
  kDisputesOpened,
  kDisputesResolved,
  kDisputesEscalated,
  kRejectedCalls,
  kIdempotentReplays,
  kSweeperActions,
  kEventsPublished,
  kEventDeliveryFailures,
  kCount,
};

[[nodiscard]] std::string_view to_string(Metric metric) noexcept;

struct Sample {
  Metric metric{Metric::kTransitions};
  std::int64_t value{};
};

// Streaming histogram with O(1) recording and O(bucket_count) percentile computation.
// Uses log2-scale buckets from 1ns to ~1s (30 buckets).
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

// Counters keyed by Metric plus a latency histogram per operation name.
// A disabled sink drops everything.
class TelemetrySink {
 public:
  explicit TelemetrySink(bool enabled = true) : enabled_(enabled) {}

  void increment(Metric metric, std::int64_t delta = 1);
  void record_latency(std::string_view operation, std::chrono::nanoseconds latency);

  [[nodiscard]] std::int64_t counter(Metric metric) const;
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

  // Returns non-zero counters and resets them.
  [[nodiscard]] std::vector<Sample> drain();

  struct Summary {
    std::string operation{};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  const bool enabled_;
  mutable std::mutex mutex_;
  std::array<std::int64_t, static_cast<std::size_t>(Metric::kCount)> counters_{};
  std::map<std::string, StreamingHistogram, std::less<>> histograms_{};
};

// Records the lifetime of the scope as one latency sample.
class ScopedLatency {
 public:
  ScopedLatency(TelemetrySink* sink, std::string_view operation)
      : sink_(sink), operation_(operation), started_(std::chrono::steady_clock::now()) {}
  ScopedLatency(const ScopedLatency&) = delete;
  ScopedLatency& operator=(const ScopedLatency&) = delete;
  ~ScopedLatency() {
    if (sink_) {
      sink_->record_latency(operation_, std::chrono::steady_clock::now() - started_);
    }
  }

 private:
  TelemetrySink* sink_;
  std::string_view operation_;
  std::chrono::steady_clock::time_point started_;
};

}  // namespace telemetry
}  // namespace escrowcore
