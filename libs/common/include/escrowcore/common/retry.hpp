#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <thread>

#include "escrowcore/common/error.hpp"

namespace escrowcore {
namespace common {

struct BackoffPolicy {
  std::size_t max_attempts{5};
  std::chrono::milliseconds base_delay{50};
  std::chrono::milliseconds max_delay{2'000};
};

// Re-invokes `op` while it fails with a retryable error, doubling the delay
// between attempts. Op: () -> Outcome<T>. Safe only for operations that are
// idempotent under retry.
template <typename Op>
auto retry_with_backoff(Op&& op, const BackoffPolicy& policy) -> decltype(op()) {
  auto delay = policy.base_delay;
  const std::size_t attempts = std::max<std::size_t>(policy.max_attempts, 1);
  for (std::size_t attempt = 1;; ++attempt) {
    auto result = op();
    if (result.ok() || !is_retryable(result.error()) || attempt >= attempts) {
      return result;
    }
    std::this_thread::sleep_for(delay);
    delay = std::min(delay * 2, policy.max_delay);
  }
}

}  // namespace common
}  // namespace escrowcore
