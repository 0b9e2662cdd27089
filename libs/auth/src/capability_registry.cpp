#include "escrowcore/auth/capability_registry.hpp"

#include <sodium.h>

#include <cstring>
#include <stdexcept>

#include "escrowcore/common/log.hpp"

namespace escrowcore {
namespace auth {

namespace {

constexpr std::string_view kComponent = "auth";
constexpr std::string_view kGrantDomain = "escrowcore.grant.v1";

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any crypto operations
void ensure_sodium_init() {
  static SodiumInitializer init;
}

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> parse_hex(std::string_view hex) {
  ensure_sodium_init();
  std::array<std::uint8_t, N> out{};
  std::size_t written = 0;
  if (hex.size() != N * 2 ||
      sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &written, nullptr) != 0 ||
      written != N) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

CapabilityRegistry::CapabilityRegistry() {
  ensure_sodium_init();
}

CapabilityRegistry::CapabilityRegistry(const PublicKey& issuer) : issuer_(issuer) {
  ensure_sodium_init();
}

CapabilityRegistry::~CapabilityRegistry() = default;

void CapabilityRegistry::set_issuer(const PublicKey& issuer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (issuer_ && *issuer_ != issuer) {
    // Grants signed by the previous issuer are no longer trusted.
    grants_.clear();
  }
  issuer_ = issuer;
}

bool CapabilityRegistry::has_issuer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return issuer_.has_value();
}

bool CapabilityRegistry::register_grant(const CapabilityGrant& grant) {
  std::optional<PublicKey> issuer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    issuer = issuer_;
  }
  if (!issuer) {
    ESCROWCORE_LOG_WARN(kComponent, "grant for user " << grant.user << " ignored: no issuer key configured");
    return false;
  }

  const auto message = grant_message(grant.user, grant.capability);
  if (!verify_with_key(*issuer, message, grant.signature)) {
    ESCROWCORE_LOG_WARN(kComponent, "rejected grant '" << grant.capability << "' for user " << grant.user
                                                      << ": bad signature");
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  grants_.emplace(grant.user, grant.capability);
  return true;
}

void CapabilityRegistry::revoke(common::UserId user, std::string_view capability) {
  std::lock_guard<std::mutex> lock(mutex_);
  grants_.erase(std::make_pair(user, std::string(capability)));
}

bool CapabilityRegistry::has_capability(common::UserId user, std::string_view capability) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return grants_.find(std::make_pair(user, std::string(capability))) != grants_.end();
}

std::size_t CapabilityRegistry::grant_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return grants_.size();
}

std::vector<std::byte> CapabilityRegistry::grant_message(common::UserId user, std::string_view capability) {
  // domain | user (8 bytes, host order) | capability
  std::vector<std::byte> message(kGrantDomain.size() + sizeof(user) + capability.size());
  auto* out = message.data();
  std::memcpy(out, kGrantDomain.data(), kGrantDomain.size());
  out += kGrantDomain.size();
  std::memcpy(out, &user, sizeof(user));
  out += sizeof(user);
  std::memcpy(out, capability.data(), capability.size());
  return message;
}

bool CapabilityRegistry::verify_with_key(const PublicKey& public_key, std::span<const std::byte> message,
                                         const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(signature.data(), reinterpret_cast<const unsigned char*>(message.data()),
                                     message.size(), public_key.data()) == 0;
}

bool CapabilityRegistry::sign(const SecretKey& secret_key, std::span<const std::byte> message,
                              Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(out_signature.data(), nullptr, reinterpret_cast<const unsigned char*>(message.data()),
                              message.size(), secret_key.data()) == 0;
}

void CapabilityRegistry::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

CapabilityGrant CapabilityRegistry::issue(const SecretKey& issuer_secret, common::UserId user,
                                          std::string_view capability) {
  CapabilityGrant grant{.user = user, .capability = std::string(capability), .signature = {}};
  if (!sign(issuer_secret, grant_message(user, capability), grant.signature)) {
    throw std::runtime_error("failed to sign capability grant");
  }
  return grant;
}

std::optional<PublicKey> CapabilityRegistry::parse_public_key(std::string_view hex) {
  return parse_hex<kPublicKeySize>(hex);
}

std::optional<Signature> CapabilityRegistry::parse_signature(std::string_view hex) {
  return parse_hex<kSignatureSize>(hex);
}

std::string CapabilityRegistry::to_hex(std::span<const std::uint8_t> bytes) {
  ensure_sodium_init();
  std::string hex(bytes.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
  hex.pop_back();
  return hex;
}

}  // namespace auth
}  // namespace escrowcore
