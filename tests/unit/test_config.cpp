#include "test_config.hpp"

#include <algorithm>
#include <cassert>
#include <string>

#include "escrowcore/config/config_loader.hpp"

namespace escrowcore::tests {

using config::ConfigLoader;

namespace {

bool has_error(const config::LoadResult& result, const std::string& field) {
  return std::any_of(result.errors.begin(), result.errors.end(),
                     [&](const config::ValidationError& err) { return err.field == field; });
}

}  // namespace

void test_config_defaults() {
  auto result = ConfigLoader::load_from_string(ConfigLoader::generate_default());
  assert(result.success);
  const auto& cfg = result.config;
  assert(cfg.escrow.fee_basis_points == 500);
  assert(cfg.escrow.supported_currencies.size() == 6);
  assert(cfg.timeouts.delivery_confirmation_hours == 72);
  assert(cfg.timeouts.payment_processing_minutes == 15);
  assert(cfg.timeouts.pending_expiry_hours == 24);
  assert(cfg.timeouts.dispute_sla_hours == 168);
  assert(cfg.timeouts.timeout_policy == "auto_release");
  assert(cfg.sweeper.interval_seconds == 60);
  assert(cfg.idempotency.ttl_hours == 168);
  assert(cfg.events.history_limit == 1000);
  assert(cfg.logging.level == "info");
  assert(cfg.auth.issuer_public_key.empty());

  auto empty = ConfigLoader::load_from_string("");
  assert(empty.success);
  assert(empty.config.persistence.wal_path == "/var/lib/escrowcore/ledger.wal");

  auto missing = ConfigLoader::load("/nonexistent/escrowcore.toml");
  assert(!missing.success && !missing.raw_error.empty());
}

void test_config_overrides() {
  const std::string issuer(64, 'a');
  const std::string signature(128, 'b');
  auto result = ConfigLoader::load_from_string(R"(
[escrow]
fee_basis_points = 250
supported_currencies = ["USD", "EUR"]
platform_owner = 1

[timeouts]
delivery_confirmation_hours = 48
timeout_policy = "auto_refund"

[sweeper]
enabled = false
interval_seconds = 5

[persistence]
wal_path = "/tmp/escrow/ledger.wal"
fsync_on_commit = false
snapshots_retained = 5

[logging]
level = "debug"

[auth]
issuer_public_key = ")" + issuer + R"("

[[auth.grants]]
user = 909
capability = "moderate"
signature = ")" + signature + R"("
)");
  assert(result.success);
  const auto& cfg = result.config;
  assert(cfg.escrow.fee_basis_points == 250);
  assert(cfg.escrow.supported_currencies.size() == 2);
  assert(cfg.escrow.platform_owner == 1);
  assert(cfg.timeouts.delivery_confirmation_hours == 48);
  assert(cfg.timeouts.payment_processing_minutes == 15);
  assert(cfg.timeouts.timeout_policy == "auto_refund");
  assert(!cfg.sweeper.enabled && cfg.sweeper.interval_seconds == 5);
  assert(cfg.persistence.wal_path == "/tmp/escrow/ledger.wal");
  assert(!cfg.persistence.fsync_on_commit);
  assert(cfg.persistence.snapshots_retained == 5);
  assert(cfg.logging.level == "debug");
  assert(cfg.auth.grants.size() == 1);
  assert(cfg.auth.grants.front().user == 909);
  assert(cfg.auth.grants.front().capability == "moderate");
}

void test_config_validation() {
  auto result = ConfigLoader::load_from_string(R"(
[escrow]
fee_basis_points = 20000
supported_currencies = ["USD", "dollars"]

[timeouts]
timeout_policy = "coin_flip"
pending_expiry_hours = 0

[persistence]
snapshots_retained = 0

[logging]
level = "loud"

[[auth.grants]]
user = 1
capability = "moderate"
signature = "00"
)");
  assert(!result.success);
  assert(has_error(result, "escrow.fee_basis_points"));
  assert(has_error(result, "escrow.supported_currencies[1]"));
  assert(has_error(result, "timeouts.timeout_policy"));
  assert(has_error(result, "timeouts.pending_expiry_hours"));
  assert(has_error(result, "persistence.snapshots_retained"));
  assert(has_error(result, "logging.level"));
  assert(has_error(result, "auth.grants[0]"));
  assert(has_error(result, "auth.grants[0].signature"));

  auto broken = ConfigLoader::load_from_string("[escrow\nfee = ");
  assert(!broken.success);
  assert(!broken.raw_error.empty());
}

}  // namespace escrowcore::tests
