#include "test_auth.hpp"

#include <cassert>
#include <span>
#include <string_view>

#include "stablecore/auth/authenticator.hpp"
#include "test_support.hpp"

namespace stablecore::tests {

using auth::AuthStatus;

void test_signature_verification() {
  auth::Authenticator authenticator;
  auth::PublicKey public_key{};
  auth::SecretKey secret_key{};
  auth::Authenticator::generate_keypair(public_key, secret_key);

  constexpr std::string_view kMessage = "deposit 1001 1 5";
  const auto message = std::as_bytes(std::span(kMessage.data(), kMessage.size()));

  auth::Signature signature{};
  assert(auth::Authenticator::sign(secret_key, message, signature));
  assert(auth::Authenticator::verify_with_key(public_key, message, signature));

  assert(!authenticator.verify(kAlice, message, signature));
  authenticator.register_account(kAlice, public_key);
  assert(authenticator.has_account(kAlice));
  assert(authenticator.account_count() == 1);
  assert(authenticator.public_key(kAlice) == public_key);
  assert(authenticator.verify(kAlice, message, signature));

  auto tampered = signature;
  tampered[0] ^= 0x01;
  assert(!authenticator.verify(kAlice, message, tampered));
  assert(!authenticator.verify(kAlice, message.first(message.size() - 1), signature));

  assert(authenticator.consume_nonce(kAlice, 1));
  assert(authenticator.consume_nonce(kAlice, 5));
  assert(!authenticator.consume_nonce(kAlice, 5));
  assert(!authenticator.consume_nonce(kAlice, 2));
  assert(authenticator.last_nonce(kAlice) == 5u);

  authenticator.unregister_account(kAlice);
  assert(!authenticator.has_account(kAlice));
  assert(!authenticator.public_key(kAlice).has_value());
  assert(!authenticator.last_nonce(kAlice).has_value());
}

void test_request_authentication() {
  auth::Authenticator authenticator;
  auth::RequestAuthenticator gate(authenticator);

  auth::PublicKey alice_public{};
  auth::SecretKey alice_secret{};
  auth::Authenticator::generate_keypair(alice_public, alice_secret);
  auth::PublicKey bob_public{};
  auth::SecretKey bob_secret{};
  auth::Authenticator::generate_keypair(bob_public, bob_secret);

  engine::OperationRequest request{
      .op = engine::Operation::kDeposit, .account = kAlice, .asset = kWeth, .amount = units(1), .nonce = 1};
  auto signed_request = auth::sign_request(alice_secret, request);
  assert(signed_request.has_value());

  assert(gate.verify(*signed_request) == AuthStatus::kUnknownAccount);
  authenticator.register_account(kAlice, alice_public);
  authenticator.register_account(kBob, bob_public);

  // Signed by the wrong key: rejected, nonce untouched.
  auto forged = auth::sign_request(bob_secret, request);
  assert(forged.has_value());
  assert(gate.verify(*forged) == AuthStatus::kBadSignature);
  assert(!authenticator.last_nonce(kAlice).has_value());

  // Altering any field invalidates the signature.
  auto altered = *signed_request;
  altered.request.amount = units(100);
  assert(gate.verify(altered) == AuthStatus::kBadSignature);

  assert(gate.verify(*signed_request) == AuthStatus::kAccepted);
  assert(authenticator.last_nonce(kAlice) == 1u);
  assert(gate.verify(*signed_request) == AuthStatus::kStaleNonce);

  request.nonce = 2;
  auto next = auth::sign_request(alice_secret, request);
  assert(next.has_value());
  assert(gate.verify(*next) == AuthStatus::kAccepted);

  assert(auth::to_string(AuthStatus::kStaleNonce) == "StaleNonce");
}

}  // namespace stablecore::tests
