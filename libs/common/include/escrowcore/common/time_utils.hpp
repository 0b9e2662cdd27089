#pragma once

#include <atomic>
#include <chrono>
#include <mutex>

#include "escrowcore/common/types.hpp"

namespace escrowcore {
namespace common {

using Deadline = std::chrono::steady_clock::time_point;

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

inline TimestampNs now_wall_ns() noexcept {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline Deadline deadline_after(std::chrono::nanoseconds timeout) noexcept {
  return std::chrono::steady_clock::now() + timeout;
}

inline Deadline no_deadline() noexcept {
  return Deadline::max();
}

// Blocks until the lock is held or the deadline passes.
template <typename Mutex>
bool lock_until(std::unique_lock<Mutex>& lock, Deadline deadline) {
  if (deadline == Deadline::max()) {
    lock.lock();
    return true;
  }
  return lock.try_lock_until(deadline);
}

inline constexpr TimestampNs to_ns(std::chrono::nanoseconds duration) noexcept {
  return duration.count();
}

// Wall-clock source for record timestamps and timeout evaluation.
class Clock {
 public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual TimestampNs now() const noexcept = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] TimestampNs now() const noexcept override { return now_wall_ns(); }
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimestampNs start = 1'700'000'000'000'000'000) : now_(start) {}

  [[nodiscard]] TimestampNs now() const noexcept override { return now_.load(std::memory_order_acquire); }
  void advance(std::chrono::nanoseconds delta) noexcept { now_.fetch_add(delta.count(), std::memory_order_acq_rel); }
  void set(TimestampNs value) noexcept { now_.store(value, std::memory_order_release); }

 private:
  std::atomic<TimestampNs> now_;
};

}  // namespace common
}  // namespace escrowcore
