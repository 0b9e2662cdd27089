#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace escrowcore {
namespace ledger {
namespace detail {

class ByteWriter {
 public:
  template <typename T>
  void put(T value) {
    static_assert(std::is_trivially_copyable_v<T>);
    const auto* raw = reinterpret_cast<const std::byte*>(&value);
    bytes_.insert(bytes_.end(), raw, raw + sizeof(T));
  }

  void put_string(const std::string& value) {
    put(static_cast<std::uint32_t>(value.size()));
    const auto* raw = reinterpret_cast<const std::byte*>(value.data());
    bytes_.insert(bytes_.end(), raw, raw + value.size());
  }

  std::vector<std::byte> take() { return std::move(bytes_); }

 private:
  std::vector<std::byte> bytes_{};
};

class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

  template <typename T>
  T get() {
    static_assert(std::is_trivially_copyable_v<T>);
    require(sizeof(T));
    T value;
    std::memcpy(&value, data_.data() + offset_, sizeof(T));
    offset_ += sizeof(T);
    return value;
  }

  std::string get_string() {
    const auto size = get<std::uint32_t>();
    require(size);
    std::string value(reinterpret_cast<const char*>(data_.data() + offset_), size);
    offset_ += size;
    return value;
  }

  void expect_end() const {
    if (offset_ != data_.size()) {
      throw std::runtime_error("trailing bytes in journal record");
    }
  }

 private:
  void require(std::size_t n) const {
    if (offset_ + n > data_.size()) {
      throw std::runtime_error("truncated journal record");
    }
  }

  std::span<const std::byte> data_;
  std::size_t offset_{0};
};

}  // namespace detail
}  // namespace ledger
}  // namespace escrowcore
