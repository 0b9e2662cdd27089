#include "escrowcore/wal/wal_writer.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace escrowcore {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x4553574c;  // 'ESWL'
constexpr std::uint16_t kVersion = 1;

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

int get_fileno(std::FILE* file) {
#if defined(_WIN32)
  return _fileno(file);
#else
  return fileno(file);
#endif
}

void fsync_file(std::FILE* file) {
  const int fd = get_fileno(file);
#if defined(_WIN32)
  if (::FlushFileBuffers(reinterpret_cast<HANDLE>(_get_osfhandle(fd))) == 0) {
    throw std::system_error(static_cast<int>(GetLastError()), std::system_category(), "FlushFileBuffers failed");
  }
#else
  if (::fsync(fd) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
#endif
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, WriterOptions options)
    : path_(path), options_(options) {
  buffer_.reserve(options_.flush_threshold_bytes);
  open_and_recover();
}

Writer::~Writer() {
  if (file_) {
    if (!buffer_.empty()) {
      std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
    }
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open_and_recover() {
  if (std::filesystem::exists(path_)) {
    std::uint64_t valid_offset = 0;
    bool torn = false;
    {
      Reader reader(path_);
      Record record;
      while (reader.next(record)) {
        next_sequence_ = record.header.sequence + 1;
      }
      valid_offset = reader.valid_offset();
      torn = reader.torn_tail();
    }
    durable_bytes_ = valid_offset;
    // Drop the partial record a crash left behind so new appends stay framed.
    if (torn) {
      std::filesystem::resize_file(path_, valid_offset);
    }
  }

  file_ = std::fopen(path_.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open WAL file: " + path_.string());
  }
}

std::uint64_t Writer::append(const RecordView& record_view) {
  if (!file_) {
    throw std::runtime_error("WAL writer not open");
  }

  RecordHeader header;
  header.magic = kMagic;
  header.version = kVersion;
  header.kind = record_view.kind;
  header.sequence = next_sequence_;
  header.payload_size = static_cast<std::uint32_t>(record_view.payload.size());
  header.checksum = checksum32(record_view.payload);

  const auto rollback_size = buffer_.size();
  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), record_view.payload.begin(), record_view.payload.end());

  if (buffer_.size() >= options_.flush_threshold_bytes) {
    try {
      flush();
      if (options_.fsync_on_commit) {
        fsync_file(file_);
      }
    } catch (const std::exception&) {
      buffer_.resize(rollback_size);
      discard_partial_write();
      throw;
    }
  }
  return next_sequence_++;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write WAL buffer: " + path_.string());
  }
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "fflush failed");
  }
  durable_bytes_ += buffer_.size();
  buffer_.clear();
}

void Writer::discard_partial_write() {
  // Cut the file back to the last complete record so a failed append never
  // leaves a half-written frame in front of later records.
  std::fclose(file_);
  file_ = nullptr;
  std::error_code ec;
  std::filesystem::resize_file(path_, durable_bytes_, ec);
  if (!ec) {
    file_ = std::fopen(path_.c_str(), "ab");
  }
  // Otherwise the writer stays closed and every later append throws.
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  fsync_file(file_);
}

Reader::Reader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open WAL for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_ || torn_tail_) {
    return false;
  }

  RecordHeader header;
  const auto header_bytes = std::fread(&header, 1, sizeof(RecordHeader), file_);
  if (header_bytes == 0) {
    return false;
  }
  if (header_bytes != sizeof(RecordHeader)) {
    torn_tail_ = true;
    return false;
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid WAL magic in " + path_.string());
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported WAL version in " + path_.string());
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      torn_tail_ = true;
      return false;
    }
  }

  if (header.checksum != checksum32(std::span<const std::byte>(out_record.payload.data(), out_record.payload.size()))) {
    // A bad checksum on the final record is an interrupted write; anywhere
    // else it is corruption.
    if (std::fgetc(file_) == EOF) {
      torn_tail_ = true;
      return false;
    }
    throw std::runtime_error("WAL checksum mismatch at sequence " + std::to_string(header.sequence));
  }

  valid_offset_ += sizeof(RecordHeader) + header.payload_size;
  return true;
}

void Reader::seek_sequence(std::uint64_t sequence) {
  if (!file_) {
    return;
  }
  std::rewind(file_);
  valid_offset_ = 0;
  torn_tail_ = false;
  Record record;
  while (next(record)) {
    if (record.header.sequence >= sequence) {
      const auto offset = static_cast<long>(sizeof(RecordHeader) + record.header.payload_size);
      if (std::fseek(file_, -offset, SEEK_CUR) != 0) {
        throw std::runtime_error("failed to seek in WAL");
      }
      valid_offset_ -= static_cast<std::uint64_t>(offset);
      break;
    }
  }
}

}  // namespace wal
}  // namespace escrowcore
