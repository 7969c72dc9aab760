#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>

#include "stablecore/common/types.hpp"
#include "stablecore/engine/operation_request.hpp"

namespace stablecore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Per-account ed25519 keys and replay protection.
class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  void register_account(common::AccountId account, const PublicKey& public_key);
  void unregister_account(common::AccountId account);
  bool has_account(common::AccountId account) const;
  std::optional<PublicKey> public_key(common::AccountId account) const;

  // Verify a detached signature against the account's registered key.
  bool verify(common::AccountId account,
              std::span<const std::byte> message,
              const Signature& signature) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  // Client-side helpers, used by the daemon script runner and tests.
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);

  // Accepts `nonce` only if it is strictly greater than the last accepted
  // nonce for the account, and records it.
  bool consume_nonce(common::AccountId account, std::uint64_t nonce);
  std::optional<std::uint64_t> last_nonce(common::AccountId account) const;

  std::size_t account_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, PublicKey> keys_;
  std::unordered_map<common::AccountId, std::uint64_t> nonces_;
};

struct SignedRequest {
  engine::OperationRequest request{};
  Signature signature{};
};

enum class AuthStatus : std::uint8_t {
  kAccepted,
  kUnknownAccount,
  kBadSignature,
  kStaleNonce,
};

std::string_view to_string(AuthStatus status) noexcept;

// Checks a SignedRequest: the signature must cover encode(request) under the
// key of request.account, and the nonce must be fresh. The nonce is consumed
// only when everything else verified.
class RequestAuthenticator {
 public:
  explicit RequestAuthenticator(Authenticator& auth);

  AuthStatus verify(const SignedRequest& signed_request);

 private:
  Authenticator& auth_;
};

std::optional<SignedRequest> sign_request(const SecretKey& secret_key, const engine::OperationRequest& request);

}  // namespace auth
}  // namespace stablecore
