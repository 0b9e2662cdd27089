#include "escrowcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool is_hex(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

EscrowConfig parse_escrow(const toml::table& root) {
  EscrowConfig cfg;
  if (auto* escrow = root["escrow"].as_table()) {
    cfg.fee_basis_points = static_cast<std::int32_t>(get_int_or(*escrow, "fee_basis_points", cfg.fee_basis_points));
    cfg.platform_owner = static_cast<std::uint64_t>(
        get_int_or(*escrow, "platform_owner", static_cast<std::int64_t>(cfg.platform_owner)));
    if (auto* currencies = (*escrow)["supported_currencies"].as_array()) {
      cfg.supported_currencies.clear();
      for (const auto& elem : *currencies) {
        if (auto code = elem.value<std::string_view>()) {
          cfg.supported_currencies.emplace_back(*code);
        }
      }
    }
  }
  return cfg;
}

TimeoutConfig parse_timeouts(const toml::table& root) {
  TimeoutConfig cfg;
  if (auto* timeouts = root["timeouts"].as_table()) {
    cfg.delivery_confirmation_hours =
        get_int_or(*timeouts, "delivery_confirmation_hours", cfg.delivery_confirmation_hours);
    cfg.payment_processing_minutes =
        get_int_or(*timeouts, "payment_processing_minutes", cfg.payment_processing_minutes);
    cfg.pending_expiry_hours = get_int_or(*timeouts, "pending_expiry_hours", cfg.pending_expiry_hours);
    cfg.dispute_sla_hours = get_int_or(*timeouts, "dispute_sla_hours", cfg.dispute_sla_hours);
    cfg.timeout_policy = get_str_or(*timeouts, "timeout_policy", cfg.timeout_policy);
  }
  return cfg;
}

SweeperConfig parse_sweeper(const toml::table& root) {
  SweeperConfig cfg;
  if (auto* sweeper = root["sweeper"].as_table()) {
    cfg.enabled = get_bool_or(*sweeper, "enabled", cfg.enabled);
    cfg.interval_seconds = get_int_or(*sweeper, "interval_seconds", cfg.interval_seconds);
    cfg.retry_attempts = static_cast<std::uint32_t>(get_int_or(*sweeper, "retry_attempts", cfg.retry_attempts));
    cfg.retry_base_delay_ms = get_int_or(*sweeper, "retry_base_delay_ms", cfg.retry_base_delay_ms);
    cfg.retry_max_delay_ms = get_int_or(*sweeper, "retry_max_delay_ms", cfg.retry_max_delay_ms);
  }
  return cfg;
}

IdempotencyConfig parse_idempotency(const toml::table& root) {
  IdempotencyConfig cfg;
  if (auto* idempotency = root["idempotency"].as_table()) {
    cfg.ttl_hours = get_int_or(*idempotency, "ttl_hours", cfg.ttl_hours);
  }
  return cfg;
}

EventsConfig parse_events(const toml::table& root) {
  EventsConfig cfg;
  if (auto* events = root["events"].as_table()) {
    cfg.history_limit = static_cast<std::size_t>(
        get_int_or(*events, "history_limit", static_cast<std::int64_t>(cfg.history_limit)));
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.fsync_on_commit = get_bool_or(*persistence, "fsync_on_commit", cfg.fsync_on_commit);
    cfg.snapshot_interval_seconds =
        get_int_or(*persistence, "snapshot_interval_seconds", cfg.snapshot_interval_seconds);
    cfg.snapshots_retained = get_int_or(*persistence, "snapshots_retained", cfg.snapshots_retained);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.level = get_str_or(*logging, "level", cfg.level);
  }
  return cfg;
}

AuthConfig parse_auth(const toml::table& root) {
  AuthConfig cfg;
  if (auto* auth = root["auth"].as_table()) {
    cfg.issuer_public_key = get_str_or(*auth, "issuer_public_key", cfg.issuer_public_key);
    if (auto* grants = (*auth)["grants"].as_array()) {
      for (const auto& elem : *grants) {
        if (auto* grant_tbl = elem.as_table()) {
          GrantConfig grant;
          grant.user = static_cast<std::uint64_t>(get_int_or(*grant_tbl, "user", 0));
          grant.capability = get_str_or(*grant_tbl, "capability", "");
          grant.signature = get_str_or(*grant_tbl, "signature", "");
          cfg.grants.push_back(std::move(grant));
        }
      }
    }
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.escrow = parse_escrow(root);
  cfg.timeouts = parse_timeouts(root);
  cfg.sweeper = parse_sweeper(root);
  cfg.idempotency = parse_idempotency(root);
  cfg.events = parse_events(root);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.logging = parse_logging(root);
  cfg.auth = parse_auth(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.escrow.fee_basis_points < 0 || config.escrow.fee_basis_points > 10'000) {
    errors.push_back({"escrow.fee_basis_points", "must be between 0 and 10000"});
  }

  if (config.escrow.supported_currencies.empty()) {
    errors.push_back({"escrow.supported_currencies", "at least one currency is required"});
  }
  for (std::size_t i = 0; i < config.escrow.supported_currencies.size(); ++i) {
    const auto& code = config.escrow.supported_currencies[i];
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isupper(c); })) {
      errors.push_back({"escrow.supported_currencies[" + std::to_string(i) + "]", "must be a 3-letter ISO code"});
    }
  }

  if (config.timeouts.delivery_confirmation_hours <= 0) {
    errors.push_back({"timeouts.delivery_confirmation_hours", "must be positive"});
  }

  if (config.timeouts.payment_processing_minutes <= 0) {
    errors.push_back({"timeouts.payment_processing_minutes", "must be positive"});
  }

  if (config.timeouts.pending_expiry_hours <= 0) {
    errors.push_back({"timeouts.pending_expiry_hours", "must be positive"});
  }

  if (config.timeouts.dispute_sla_hours <= 0) {
    errors.push_back({"timeouts.dispute_sla_hours", "must be positive"});
  }

  if (config.timeouts.timeout_policy != "auto_release" && config.timeouts.timeout_policy != "auto_refund") {
    errors.push_back({"timeouts.timeout_policy", "must be auto_release or auto_refund"});
  }

  if (config.sweeper.interval_seconds <= 0) {
    errors.push_back({"sweeper.interval_seconds", "must be positive"});
  }

  if (config.sweeper.retry_attempts == 0) {
    errors.push_back({"sweeper.retry_attempts", "must be greater than 0"});
  }

  if (config.sweeper.retry_base_delay_ms < 0 || config.sweeper.retry_max_delay_ms < config.sweeper.retry_base_delay_ms) {
    errors.push_back({"sweeper.retry_max_delay_ms", "must be >= retry_base_delay_ms >= 0"});
  }

  if (config.idempotency.ttl_hours <= 0) {
    errors.push_back({"idempotency.ttl_hours", "must be positive"});
  }

  if (config.events.history_limit == 0) {
    errors.push_back({"events.history_limit", "must be greater than 0"});
  }

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  if (config.persistence.snapshot_interval_seconds <= 0) {
    errors.push_back({"persistence.snapshot_interval_seconds", "must be positive"});
  }

  if (config.persistence.snapshots_retained < 1) {
    errors.push_back({"persistence.snapshots_retained", "must keep at least one snapshot"});
  }

  if (!log::parse_level(config.logging.level)) {
    errors.push_back({"logging.level", "must be one of trace, debug, info, warn, error, off"});
  }

  const auto& issuer = config.auth.issuer_public_key;
  if (!issuer.empty() && (issuer.size() != 64 || !is_hex(issuer))) {
    errors.push_back({"auth.issuer_public_key", "must be 64 hex characters"});
  }

  for (std::size_t i = 0; i < config.auth.grants.size(); ++i) {
    const auto& grant = config.auth.grants[i];
    std::string prefix = "auth.grants[" + std::to_string(i) + "]";

    if (issuer.empty()) {
      errors.push_back({prefix, "grants require auth.issuer_public_key"});
    }

    if (grant.capability.empty()) {
      errors.push_back({prefix + ".capability", "cannot be empty"});
    }

    if (grant.signature.size() != 128 || !is_hex(grant.signature)) {
      errors.push_back({prefix + ".signature", "must be 128 hex characters"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# escrowcore Engine Configuration
# Generated default configuration

[escrow]
fee_basis_points = 500  # 5%
supported_currencies = ["USD", "EUR", "GBP", "RUB", "JPY", "CNY"]
platform_owner = 0

[timeouts]
delivery_confirmation_hours = 72
payment_processing_minutes = 15
pending_expiry_hours = 24
dispute_sla_hours = 168  # 7 days
timeout_policy = "auto_release"

[sweeper]
enabled = true
interval_seconds = 60
retry_attempts = 5
retry_base_delay_ms = 50
retry_max_delay_ms = 2000

[idempotency]
ttl_hours = 168

[events]
history_limit = 1000

[persistence]
wal_path = "/var/lib/escrowcore/ledger.wal"
snapshot_dir = "/var/lib/escrowcore/snapshots"
fsync_on_commit = true
snapshot_interval_seconds = 300
snapshots_retained = 3

[telemetry]
enabled = true

[logging]
level = "info"

[auth]
issuer_public_key = ""

# [[auth.grants]]
# user = 42
# capability = "moderate"
# signature = "<128 hex chars signed by the issuer>"
)";
}

}  // namespace config
}  // namespace escrowcore
