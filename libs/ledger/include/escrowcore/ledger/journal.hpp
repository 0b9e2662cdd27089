#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "escrowcore/common/types.hpp"
#include "escrowcore/ledger/ledger_types.hpp"
#include "escrowcore/wal/wal_writer.hpp"

namespace escrowcore {
namespace ledger {

enum class JournalKind : std::uint16_t {
  kWalletOpened = 1,
  kPosting = 2,
  kWalletStatus = 3,
};

struct WalletOpenedRecord {
  common::WalletId wallet{0};
  common::UserId owner{0};
  common::Currency currency{};
};

struct PostingRecord {
  common::TimestampNs timestamp{0};
  Posting posting{};
};

struct WalletStatusRecord {
  common::WalletId wallet{0};
  WalletStatus status{WalletStatus::kActive};
};

std::vector<std::byte> encode(const WalletOpenedRecord& record);
std::vector<std::byte> encode(const PostingRecord& record);
std::vector<std::byte> encode(const WalletStatusRecord& record);

WalletOpenedRecord decode_wallet_opened(std::span<const std::byte> payload);
PostingRecord decode_posting(std::span<const std::byte> payload);
WalletStatusRecord decode_wallet_status(std::span<const std::byte> payload);

// Durable sink for ledger mutations. append() must either make the record
// durable and return its sequence, or throw and leave no trace of it.
class Journal {
 public:
  virtual ~Journal() = default;
  virtual common::SequenceId append(JournalKind kind, std::span<const std::byte> payload) = 0;
  [[nodiscard]] virtual common::SequenceId last_sequence() const = 0;
};

class WalJournal final : public Journal {
 public:
  explicit WalJournal(const std::filesystem::path& path, bool fsync_on_commit = false);

  common::SequenceId append(JournalKind kind, std::span<const std::byte> payload) override;
  [[nodiscard]] common::SequenceId last_sequence() const override;
  void sync();

 private:
  mutable std::mutex mutex_;
  wal::Writer writer_;
};

}  // namespace ledger
}  // namespace escrowcore
