#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "escrowcore/common/types.hpp"

namespace escrowcore {
namespace snapshot {

struct SnapshotRecord {
  // WAL sequence the snapshot covers; replay resumes after it.
  common::SequenceId sequence{0};
  std::vector<std::byte> payload{};
};

// Keeps the last few ledger snapshots in one directory, one file per
// generation named after the sequence it covers. A generation that fails to
// load is skipped in favour of the next older one.
class Store {
 public:
  static constexpr std::size_t kDefaultRetained = 3;

  Store();
  explicit Store(std::filesystem::path directory, std::size_t retained = kDefaultRetained);

  void prepare(const std::filesystem::path& directory, std::size_t retained = kDefaultRetained);

  // Writes a new generation (temp file, then rename) and prunes the oldest
  // ones beyond the retention count. Throws on I/O failure.
  void persist(common::SequenceId sequence_id, std::span<const std::byte> payload);

  // Newest generation that passes its header and checksum checks.
  [[nodiscard]] std::optional<SnapshotRecord> latest() const;
  // Covered sequences of the generations on disk, newest first.
  [[nodiscard]] std::vector<common::SequenceId> generations() const;

  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
  [[nodiscard]] std::size_t retained() const noexcept { return retained_; }

 private:
  [[nodiscard]] std::filesystem::path path_for(common::SequenceId sequence_id) const;
  [[nodiscard]] SnapshotRecord load(const std::filesystem::path& path) const;
  void prune() const;

  std::filesystem::path directory_{};
  std::size_t retained_{kDefaultRetained};
};

}  // namespace snapshot
}  // namespace escrowcore
