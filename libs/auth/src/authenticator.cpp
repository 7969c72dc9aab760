#include "stablecore/auth/authenticator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace stablecore {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

void Authenticator::register_account(common::AccountId account, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_[account] = public_key;
}

void Authenticator::unregister_account(common::AccountId account) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(account);
  nonces_.erase(account);
}

bool Authenticator::has_account(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.find(account) != keys_.end();
}

std::optional<PublicKey> Authenticator::public_key(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(account);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Authenticator::verify(common::AccountId account,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  const auto key = public_key(account);
  if (!key) {
    return false;
  }
  return verify_with_key(*key, message, signature);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  if (crypto_sign_keypair(out_public.data(), out_secret.data()) != 0) {
    throw std::runtime_error("crypto_sign_keypair failed");
  }
}

bool Authenticator::consume_nonce(common::AccountId account, std::uint64_t nonce) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nonces_.find(account);
  if (it != nonces_.end() && nonce <= it->second) {
    return false;
  }
  nonces_[account] = nonce;
  return true;
}

std::optional<std::uint64_t> Authenticator::last_nonce(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nonces_.find(account);
  if (it == nonces_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t Authenticator::account_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

std::string_view to_string(AuthStatus status) noexcept {
  switch (status) {
    case AuthStatus::kAccepted:
      return "Accepted";
    case AuthStatus::kUnknownAccount:
      return "UnknownAccount";
    case AuthStatus::kBadSignature:
      return "BadSignature";
    case AuthStatus::kStaleNonce:
      return "StaleNonce";
  }
  return "Unknown";
}

RequestAuthenticator::RequestAuthenticator(Authenticator& auth) : auth_(auth) {}

AuthStatus RequestAuthenticator::verify(const SignedRequest& signed_request) {
  const auto& request = signed_request.request;
  if (!auth_.has_account(request.account)) {
    return AuthStatus::kUnknownAccount;
  }
  const auto message = engine::encode(request);
  if (!auth_.verify(request.account, message, signed_request.signature)) {
    return AuthStatus::kBadSignature;
  }
  if (!auth_.consume_nonce(request.account, request.nonce)) {
    return AuthStatus::kStaleNonce;
  }
  return AuthStatus::kAccepted;
}

std::optional<SignedRequest> sign_request(const SecretKey& secret_key, const engine::OperationRequest& request) {
  SignedRequest signed_request{.request = request};
  const auto message = engine::encode(request);
  if (!Authenticator::sign(secret_key, message, signed_request.signature)) {
    return std::nullopt;
  }
  return signed_request;
}

}  // namespace auth
}  // namespace stablecore
