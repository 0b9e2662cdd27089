#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace escrowcore {
namespace config {

struct EscrowConfig {
  std::int32_t fee_basis_points{500};
  std::vector<std::string> supported_currencies{"USD", "EUR", "GBP", "RUB", "JPY", "CNY"};
  // Owner of the platform fee wallets.
  std::uint64_t platform_owner{0};
};

struct TimeoutConfig {
  std::int64_t delivery_confirmation_hours{72};
  std::int64_t payment_processing_minutes{15};
  std::int64_t pending_expiry_hours{24};
  std::int64_t dispute_sla_hours{24 * 7};
  // "auto_release" or "auto_refund"
  std::string timeout_policy{"auto_release"};
};

struct SweeperConfig {
  bool enabled{true};
  std::int64_t interval_seconds{60};
  std::uint32_t retry_attempts{5};
  std::int64_t retry_base_delay_ms{50};
  std::int64_t retry_max_delay_ms{2000};
};

struct IdempotencyConfig {
  std::int64_t ttl_hours{24 * 7};
};

struct EventsConfig {
  std::size_t history_limit{1000};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/escrowcore/ledger.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/escrowcore/snapshots"};
  bool fsync_on_commit{true};
  std::int64_t snapshot_interval_seconds{300};
  std::int64_t snapshots_retained{3};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct LoggingConfig {
  std::string level{"info"};
};

struct GrantConfig {
  std::uint64_t user{0};
  std::string capability{};
  std::string signature{};
};

struct AuthConfig {
  // Hex-encoded ed25519 public key of the capability issuer.
  std::string issuer_public_key{};
  std::vector<GrantConfig> grants{};
};

struct EngineConfig {
  EscrowConfig escrow;
  TimeoutConfig timeouts;
  SweeperConfig sweeper;
  IdempotencyConfig idempotency;
  EventsConfig events;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
  LoggingConfig logging;
  AuthConfig auth;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace escrowcore
