#include "escrowcore/snapshot/snapshot_store.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace snapshot {

namespace {

constexpr std::string_view kComponent = "snapshot";
constexpr std::uint32_t kMagic = 0x4553534e;  // 'ESSN'
constexpr std::uint16_t kFormatVersion = 2;
constexpr std::string_view kPrefix = "ledger-";
constexpr std::string_view kSuffix = ".snapshot";

struct SnapshotHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kFormatVersion};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint64_t payload_size{0};
  std::uint32_t checksum{0};
  std::uint32_t padding{0};
};

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= 16777619u;
  }
  return hash;
}

// "ledger-00000000000000000042.snapshot" -> 42
std::optional<common::SequenceId> parse_generation(const std::filesystem::path& path) {
  const auto name = path.filename().string();
  if (name.size() <= kPrefix.size() + kSuffix.size() || !name.starts_with(kPrefix) || !name.ends_with(kSuffix)) {
    return std::nullopt;
  }
  const std::string_view digits(name.data() + kPrefix.size(), name.size() - kPrefix.size() - kSuffix.size());
  common::SequenceId sequence{0};
  const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), sequence);
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return sequence;
}

}  // namespace

Store::Store() = default;

Store::Store(std::filesystem::path directory, std::size_t retained) {
  prepare(directory, retained);
}

void Store::prepare(const std::filesystem::path& directory, std::size_t retained) {
  if (retained == 0) {
    throw std::invalid_argument("snapshot store must retain at least one generation");
  }
  if (!std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
  }
  directory_ = directory;
  retained_ = retained;
}

std::filesystem::path Store::path_for(common::SequenceId sequence_id) const {
  char name[64];
  std::snprintf(name, sizeof(name), "ledger-%020llu.snapshot", static_cast<unsigned long long>(sequence_id));
  return directory_ / name;
}

void Store::persist(common::SequenceId sequence_id, std::span<const std::byte> payload) {
  if (directory_.empty()) {
    throw std::runtime_error("snapshot store directory not set");
  }

  const auto final_path = path_for(sequence_id);
  const auto tmp_path = std::filesystem::path(final_path).concat(".tmp");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open snapshot file for write: " + tmp_path.string());
    }

    SnapshotHeader header;
    header.sequence = sequence_id;
    header.payload_size = payload.size();
    header.checksum = checksum32(payload);

    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    if (!payload.empty()) {
      out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write snapshot: " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, final_path);
  ESCROWCORE_LOG_DEBUG(kComponent, "snapshot at sequence " << sequence_id << " (" << payload.size() << " bytes)");
  prune();
}

std::vector<common::SequenceId> Store::generations() const {
  std::vector<common::SequenceId> found;
  if (directory_.empty() || !std::filesystem::exists(directory_)) {
    return found;
  }
  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    if (const auto sequence = parse_generation(entry.path())) {
      found.push_back(*sequence);
    }
  }
  std::sort(found.begin(), found.end(), std::greater<>());
  return found;
}

void Store::prune() const {
  const auto on_disk = generations();
  for (std::size_t i = retained_; i < on_disk.size(); ++i) {
    std::error_code ec;
    std::filesystem::remove(path_for(on_disk[i]), ec);
    if (ec) {
      ESCROWCORE_LOG_WARN(kComponent, "could not prune snapshot " << on_disk[i] << ": " << ec.message());
    }
  }
}

SnapshotRecord Store::load(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open snapshot file for read: " + path.string());
  }

  SnapshotHeader header;
  if (!in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
    throw std::runtime_error("truncated snapshot header: " + path.string());
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid snapshot magic: " + path.string());
  }
  if (header.version != kFormatVersion) {
    throw std::runtime_error("unsupported snapshot version " + std::to_string(header.version));
  }

  SnapshotRecord record;
  record.sequence = header.sequence;
  record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    in.read(reinterpret_cast<char*>(record.payload.data()), static_cast<std::streamsize>(header.payload_size));
    if (!in) {
      throw std::runtime_error("truncated snapshot record: " + path.string());
    }
  }
  if (checksum32(record.payload) != header.checksum) {
    throw std::runtime_error("snapshot checksum mismatch: " + path.string());
  }
  return record;
}

std::optional<SnapshotRecord> Store::latest() const {
  for (const auto sequence : generations()) {
    try {
      return load(path_for(sequence));
    } catch (const std::runtime_error& ex) {
      ESCROWCORE_LOG_WARN(kComponent, "skipping snapshot " << sequence << ": " << ex.what());
    }
  }
  return std::nullopt;
}

}  // namespace snapshot
}  // namespace escrowcore
