#include "escrowcore/ledger/journal.hpp"

#include <stdexcept>
#include <string>

#include "byte_codec.hpp"

namespace escrowcore {
namespace ledger {

using detail::ByteReader;
using detail::ByteWriter;

std::vector<std::byte> encode(const WalletOpenedRecord& record) {
  ByteWriter out;
  out.put(record.wallet);
  out.put(record.owner);
  out.put_string(record.currency);
  return out.take();
}

std::vector<std::byte> encode(const PostingRecord& record) {
  ByteWriter out;
  out.put(record.timestamp);
  out.put_string(record.posting.txn_ref);
  out.put(static_cast<std::uint32_t>(record.posting.legs.size()));
  for (const auto& leg : record.posting.legs) {
    out.put(leg.wallet);
    out.put(leg.available_delta);
    out.put(leg.held_delta);
    out.put(static_cast<std::uint8_t>(leg.reason));
  }
  return out.take();
}

std::vector<std::byte> encode(const WalletStatusRecord& record) {
  ByteWriter out;
  out.put(record.wallet);
  out.put(static_cast<std::uint8_t>(record.status));
  return out.take();
}

WalletOpenedRecord decode_wallet_opened(std::span<const std::byte> payload) {
  ByteReader in(payload);
  WalletOpenedRecord record;
  record.wallet = in.get<common::WalletId>();
  record.owner = in.get<common::UserId>();
  record.currency = in.get_string();
  in.expect_end();
  return record;
}

PostingRecord decode_posting(std::span<const std::byte> payload) {
  ByteReader in(payload);
  PostingRecord record;
  record.timestamp = in.get<common::TimestampNs>();
  record.posting.txn_ref = in.get_string();
  const auto leg_count = in.get<std::uint32_t>();
  record.posting.legs.reserve(leg_count);
  for (std::uint32_t i = 0; i < leg_count; ++i) {
    PostingLeg leg;
    leg.wallet = in.get<common::WalletId>();
    leg.available_delta = in.get<common::Amount>();
    leg.held_delta = in.get<common::Amount>();
    const auto reason = in.get<std::uint8_t>();
    if (reason > static_cast<std::uint8_t>(EntryReason::kExpire)) {
      throw std::runtime_error("unknown entry reason in journal: " + std::to_string(reason));
    }
    leg.reason = static_cast<EntryReason>(reason);
    record.posting.legs.push_back(leg);
  }
  in.expect_end();
  return record;
}

WalletStatusRecord decode_wallet_status(std::span<const std::byte> payload) {
  ByteReader in(payload);
  WalletStatusRecord record;
  record.wallet = in.get<common::WalletId>();
  const auto status = in.get<std::uint8_t>();
  if (status > static_cast<std::uint8_t>(WalletStatus::kClosed)) {
    throw std::runtime_error("unknown wallet status in journal: " + std::to_string(status));
  }
  record.status = static_cast<WalletStatus>(status);
  in.expect_end();
  return record;
}

WalJournal::WalJournal(const std::filesystem::path& path, bool fsync_on_commit)
    : writer_(path, wal::WriterOptions{.flush_threshold_bytes = 0, .fsync_on_commit = fsync_on_commit}) {}

common::SequenceId WalJournal::append(JournalKind kind, std::span<const std::byte> payload) {
  std::scoped_lock lock(mutex_);
  return writer_.append(wal::RecordView{.kind = static_cast<std::uint16_t>(kind), .payload = payload});
}

common::SequenceId WalJournal::last_sequence() const {
  std::scoped_lock lock(mutex_);
  return writer_.next_sequence() - 1;
}

void WalJournal::sync() {
  std::scoped_lock lock(mutex_);
  writer_.sync();
}

}  // namespace ledger
}  // namespace escrowcore
