#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>

#include "escrowcore/common/types.hpp"
#include "escrowcore/snapshot/snapshot_store.hpp"
#include "escrowcore/wal/wal_writer.hpp"

namespace escrowcore {
namespace replay {

struct ReplayStats {
  bool snapshot_loaded{false};
  common::SequenceId snapshot_sequence{0};
  std::uint64_t records_replayed{0};
  common::SequenceId last_sequence{0};
  // Records whose sequence did not follow the previous one.
  std::uint64_t sequence_gaps{0};
  bool torn_tail{false};
};

// Rebuilds state from the latest snapshot plus the WAL records written after it.
class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using EventHandler = std::function<void(const wal::Record&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_event_handler(EventHandler handler);
  ReplayStats execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  EventHandler event_handler_{};
};

}  // namespace replay
}  // namespace escrowcore
