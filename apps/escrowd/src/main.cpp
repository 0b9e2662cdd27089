#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <thread>

#include "escrowcore/api/escrow_service.hpp"
#include "escrowcore/auth/capability_registry.hpp"
#include "escrowcore/common/log.hpp"
#include "escrowcore/common/time_utils.hpp"
#include "escrowcore/config/config_loader.hpp"
#include "escrowcore/ledger/journal.hpp"
#include "escrowcore/snapshot/snapshot_store.hpp"
#include "escrowcore/telemetry/telemetry_sink.hpp"

namespace {

constexpr std::string_view kComponent = "escrowd";

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
  g_shutdown.store(true);
}

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./escrowcore.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./escrowcore.toml",
      "/etc/escrowcore/escrowcore.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/escrowcore/escrowcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

escrowcore::api::ServiceOptions make_options(const escrowcore::config::EngineConfig& cfg) {
  using namespace escrowcore;
  api::ServiceOptions options;
  options.ledger.supported_currencies = cfg.escrow.supported_currencies;
  options.holds.platform_owner = cfg.escrow.platform_owner;
  options.transactions.fee_basis_points = cfg.escrow.fee_basis_points;
  options.transactions.hold_ttl = std::chrono::minutes(cfg.timeouts.payment_processing_minutes);
  options.idempotency_ttl = std::chrono::hours(cfg.idempotency.ttl_hours);
  options.events.history_limit = cfg.events.history_limit;
  options.telemetry_enabled = cfg.telemetry.enabled;

  auto& sweep = options.sweeper;
  sweep.interval = std::chrono::seconds(cfg.sweeper.interval_seconds);
  sweep.delivery_confirmation = std::chrono::hours(cfg.timeouts.delivery_confirmation_hours);
  sweep.payment_processing = std::chrono::minutes(cfg.timeouts.payment_processing_minutes);
  sweep.pending_expiry = std::chrono::hours(cfg.timeouts.pending_expiry_hours);
  sweep.dispute_sla = std::chrono::hours(cfg.timeouts.dispute_sla_hours);
  sweep.timeout_policy = cfg.timeouts.timeout_policy == "auto_refund" ? sweeper::TimeoutPolicy::kAutoRefund
                                                                       : sweeper::TimeoutPolicy::kAutoRelease;
  sweep.retry.max_attempts = cfg.sweeper.retry_attempts;
  sweep.retry.base_delay = std::chrono::milliseconds(cfg.sweeper.retry_base_delay_ms);
  sweep.retry.max_delay = std::chrono::milliseconds(cfg.sweeper.retry_max_delay_ms);
  return options;
}

// Returns the number of grants accepted.
std::size_t load_capabilities(const escrowcore::config::AuthConfig& cfg, escrowcore::auth::CapabilityRegistry& registry) {
  using escrowcore::auth::CapabilityRegistry;
  if (cfg.issuer_public_key.empty()) {
    return 0;
  }
  const auto issuer = CapabilityRegistry::parse_public_key(cfg.issuer_public_key);
  if (!issuer) {
    ESCROWCORE_LOG_ERROR(kComponent, "issuer public key is not valid hex");
    return 0;
  }
  registry.set_issuer(*issuer);

  std::size_t accepted = 0;
  for (const auto& grant : cfg.grants) {
    const auto signature = CapabilityRegistry::parse_signature(grant.signature);
    if (signature &&
        registry.register_grant({.user = grant.user, .capability = grant.capability, .signature = *signature})) {
      ++accepted;
    } else {
      ESCROWCORE_LOG_WARN(kComponent, "rejected grant '" << grant.capability << "' for user " << grant.user);
    }
  }
  return accepted;
}

void report_telemetry(escrowcore::telemetry::TelemetrySink& telemetry) {
  for (const auto& sample : telemetry.drain()) {
    ESCROWCORE_LOG_INFO(kComponent, "metric " << escrowcore::telemetry::to_string(sample.metric) << "="
                                              << sample.value);
  }
  for (const auto& summary : telemetry.drain_latency()) {
    ESCROWCORE_LOG_DEBUG(kComponent, "latency " << summary.operation << " count=" << summary.count
                                                << " mean_ns=" << summary.mean_ns << " p99_ns=" << summary.p99_ns);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace escrowcore;

  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  if (const auto level = log::parse_level(cfg.logging.level)) {
    log::Logger::instance().set_level(*level);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Fee: " << cfg.escrow.fee_basis_points << " bp\n";
  std::cout << "  Currencies: " << cfg.escrow.supported_currencies.size() << "\n";
  std::cout << "  Timeout policy: " << cfg.timeouts.timeout_policy << "\n";
  std::cout << "  WAL path: " << cfg.persistence.wal_path << "\n";

  try {
    std::filesystem::create_directories(cfg.persistence.snapshot_dir);
    std::filesystem::create_directories(cfg.persistence.wal_path.parent_path());

    common::SystemClock clock;
    ledger::WalJournal journal{cfg.persistence.wal_path, cfg.persistence.fsync_on_commit};
    snapshot::Store snapshots{cfg.persistence.snapshot_dir,
                              static_cast<std::size_t>(cfg.persistence.snapshots_retained)};

    api::EscrowService service{clock, make_options(cfg), &journal};

    const auto stats = service.ledger().recover(cfg.persistence.snapshot_dir, cfg.persistence.wal_path);
    std::cout << "  Recovery: snapshot " << (stats.snapshot_loaded ? "loaded" : "absent") << ", "
              << stats.records_replayed << " WAL records replayed"
              << (stats.torn_tail ? " (torn tail discarded)" : "") << "\n";
    std::cout << "  Wallets: " << service.ledger().wallets().size() << "\n";

    const auto grants = load_capabilities(cfg.auth, service.capabilities());
    std::cout << "  Auth: " << (service.capabilities().has_issuer() ? "issuer configured" : "no issuer") << ", "
              << grants << " capability grants\n";

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    if (cfg.sweeper.enabled) {
      service.sweeper().start();
    }

    std::cout << "escrowd bootstrapped successfully\n";

    const auto snapshot_interval = std::chrono::seconds(cfg.persistence.snapshot_interval_seconds);
    auto last_snapshot = std::chrono::steady_clock::now();
    while (!g_shutdown.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (std::chrono::steady_clock::now() - last_snapshot >= snapshot_interval) {
        service.ledger().write_snapshot(snapshots);
        report_telemetry(service.telemetry());
        last_snapshot = std::chrono::steady_clock::now();
      }
    }

    ESCROWCORE_LOG_INFO(kComponent, "shutdown requested");
    service.sweeper().stop();
    service.ledger().write_snapshot(snapshots);
    journal.sync();
    report_telemetry(service.telemetry());
  } catch (const std::exception& ex) {
    ESCROWCORE_LOG_ERROR(kComponent, "fatal: " << ex.what());
    return 1;
  }

  std::cout << "escrowd stopped\n";
  return 0;
}
