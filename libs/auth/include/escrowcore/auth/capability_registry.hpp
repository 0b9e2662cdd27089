#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "escrowcore/common/types.hpp"

namespace escrowcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Required to resolve disputes.
inline constexpr std::string_view kModerate = "moderate";

// A capability handed to a user by the trusted issuer. The signature covers
// grant_message(user, capability).
struct CapabilityGrant {
  common::UserId user{0};
  std::string capability{};
  Signature signature{};
};

// Verifies issuer-signed capability grants and answers capability checks.
// The engine never issues grants itself; it only trusts the configured
// issuer key.
class CapabilityRegistry {
 public:
  CapabilityRegistry();
  explicit CapabilityRegistry(const PublicKey& issuer);
  ~CapabilityRegistry();

  void set_issuer(const PublicKey& issuer);
  [[nodiscard]] bool has_issuer() const;

  // Returns false, recording nothing, if no issuer is set or the signature
  // does not verify.
  bool register_grant(const CapabilityGrant& grant);
  void revoke(common::UserId user, std::string_view capability);

  [[nodiscard]] bool has_capability(common::UserId user, std::string_view capability) const;
  [[nodiscard]] std::size_t grant_count() const;

  [[nodiscard]] static std::vector<std::byte> grant_message(common::UserId user, std::string_view capability);

  static bool verify_with_key(const PublicKey& public_key, std::span<const std::byte> message,
                              const Signature& signature);

  // Issuer-side helpers for tooling and tests.
  static bool sign(const SecretKey& secret_key, std::span<const std::byte> message, Signature& out_signature);
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);
  static CapabilityGrant issue(const SecretKey& issuer_secret, common::UserId user, std::string_view capability);

  [[nodiscard]] static std::optional<PublicKey> parse_public_key(std::string_view hex);
  [[nodiscard]] static std::optional<Signature> parse_signature(std::string_view hex);
  [[nodiscard]] static std::string to_hex(std::span<const std::uint8_t> bytes);

 private:
  mutable std::mutex mutex_;
  std::optional<PublicKey> issuer_{};
  std::set<std::pair<common::UserId, std::string>, std::less<>> grants_{};
};

}  // namespace auth
}  // namespace escrowcore
