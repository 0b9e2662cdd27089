#include "escrowcore/replay/replay_driver.hpp"

#include <filesystem>
#include <stdexcept>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace replay {

namespace {
constexpr std::string_view kComponent = "replay";
}  // namespace

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

ReplayStats Driver::execute() {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }

  ReplayStats stats;
  common::SequenceId resume_from{1};

  if (auto snap = snapshot_store_.latest()) {
    stats.snapshot_loaded = true;
    stats.snapshot_sequence = snap->sequence;
    stats.last_sequence = snap->sequence;
    resume_from = snap->sequence + 1;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, std::span<const std::byte>(snap->payload.data(), snap->payload.size()));
    }
  }

  if (wal_path_.empty() || !std::filesystem::exists(wal_path_)) {
    return stats;
  }

  wal::Reader reader(wal_path_);
  wal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence < resume_from) {
      continue;
    }
    if (record.header.sequence != stats.last_sequence + 1) {
      ++stats.sequence_gaps;
      ESCROWCORE_LOG_WARN(kComponent, "WAL sequence jumps from " << stats.last_sequence << " to "
                                                                 << record.header.sequence);
    }
    event_handler_(record);
    ++stats.records_replayed;
    stats.last_sequence = record.header.sequence;
  }
  stats.torn_tail = reader.torn_tail();
  if (stats.torn_tail) {
    ESCROWCORE_LOG_WARN(kComponent, "discarded torn record after sequence " << stats.last_sequence);
  }
  ESCROWCORE_LOG_INFO(kComponent, "replayed " << stats.records_replayed << " records up to sequence "
                                              << stats.last_sequence);
  return stats;
}

}  // namespace replay
}  // namespace escrowcore
