#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace escrowcore {
namespace common {

using UserId = std::uint64_t;
using WalletId = std::uint64_t;
using HoldId = std::uint64_t;
using TransactionId = std::uint64_t;
using DisputeId = std::uint64_t;
using SequenceId = std::uint64_t;
using TimestampNs = std::int64_t;

// Money is always integer minor units (cents for USD).
using Amount = std::int64_t;

// Three-letter ISO 4217 code, e.g. "USD".
using Currency = std::string;

inline constexpr UserId kSystemUserId = 0;

enum class ActorKind : std::uint8_t {
  kUser,
  kSystem,
};

struct Actor {
  UserId id{0};
  ActorKind kind{ActorKind::kUser};

  [[nodiscard]] static Actor user(UserId id) noexcept { return Actor{.id = id, .kind = ActorKind::kUser}; }
  [[nodiscard]] static Actor system() noexcept { return Actor{.id = kSystemUserId, .kind = ActorKind::kSystem}; }
  [[nodiscard]] bool is_system() const noexcept { return kind == ActorKind::kSystem; }

  bool operator==(const Actor&) const = default;
};

inline std::string_view to_string(ActorKind kind) noexcept {
  switch (kind) {
    case ActorKind::kUser:
      return "user";
    case ActorKind::kSystem:
      return "system";
  }
  return "unknown";
}

}  // namespace common
}  // namespace escrowcore
