#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace escrowcore {
namespace wal {

struct RecordHeader {
  std::uint32_t magic{0x4553574c};      // 'ESWL'
  std::uint16_t version{1};
  std::uint16_t kind{0};                // caller-defined record type
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct RecordView {
  std::uint16_t kind{0};
  std::span<const std::byte> payload{};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

struct WriterOptions {
  std::size_t flush_threshold_bytes{0};  // 0 = write through on every append
  bool fsync_on_commit{false};
};

class Writer {
 public:
  explicit Writer(const std::filesystem::path& path, WriterOptions options = {});
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record. Throws on I/O failure; the
  // record is then not part of the log.
  std::uint64_t append(const RecordView& record);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_{};
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  WriterOptions options_{};
  std::uint64_t next_sequence_{1};
  std::uint64_t durable_bytes_{0};

  void open_and_recover();
  void discard_partial_write();
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at end of log. An incomplete trailing record (crash during append)
  // also ends the log and is reported by torn_tail(). Corruption before the
  // tail throws.
  bool next(Record& out_record);
  void seek_sequence(std::uint64_t sequence);

  [[nodiscard]] bool torn_tail() const noexcept { return torn_tail_; }
  // Byte offset just past the last complete record read.
  [[nodiscard]] std::uint64_t valid_offset() const noexcept { return valid_offset_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  bool torn_tail_{false};
  std::uint64_t valid_offset_{0};
};

}  // namespace wal
}  // namespace escrowcore
