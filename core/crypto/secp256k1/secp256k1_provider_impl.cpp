/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_provider_impl.hpp"

#include <array>
#include <span>

#include <boost/assert.hpp>

#include "crypto/common.hpp"
#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(peerkeys::crypto, Secp256k1ProviderError, e) {
  using E = peerkeys::crypto::Secp256k1ProviderError;
  switch (e) {
    case E::INVALID_PRIVATE_KEY:
      return "private key is not a valid secp256k1 scalar";
    case E::INVALID_PUBLIC_KEY:
      return "public key is not a valid SEC1 encoded secp256k1 point";
    case E::INVALID_SIGNATURE:
      return "signature is not a valid DER encoded ECDSA signature";
    case E::SIGN_FAILED:
      return "Internal error during secp256k1 signing";
    case E::DERIVE_FAILED:
      return "Internal error during secp256k1 public key derivation";
    case E::KEYGEN_FAILED:
      return "Could not generate a valid secp256k1 private key";
  }
  return "unknown Secp256k1ProviderError error occured";
}

namespace peerkeys::crypto {

  Secp256k1ProviderImpl::Secp256k1ProviderImpl(
      std::shared_ptr<CSPRNG> random_generator)
      : context_{secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy},
        random_generator_{std::move(random_generator)},
        logger_{log::createLogger("Secp256k1Provider", "crypto")} {
    BOOST_ASSERT(random_generator_ != nullptr);
    // side channel protection of signing and key derivation
    std::array<uint8_t, 32> seed{};
    SecureCleanGuard guard{std::span<uint8_t>(seed.data(), seed.size())};
    random_generator_->fillRandomly(seed);
    if (secp256k1_context_randomize(context_.get(), seed.data()) == 0) {
      SL_WARN(logger_, "Context randomization failed");
    }
  }

  outcome::result<Secp256k1Keypair> Secp256k1ProviderImpl::generateKeypair()
      const {
    Secp256k1PrivateKey secret_key;
    std::span<uint8_t> secret_bytes(secret_key.data(), secret_key.size());
    SecureCleanGuard guard{secret_bytes};
    for (size_t attempt = 0; attempt < kMaxKeygenAttempts; ++attempt) {
      random_generator_->fillRandomly(secret_bytes);
      if (secp256k1_ec_seckey_verify(context_.get(), secret_key.data())
          == 1) {
        return deriveKeypair(secret_key);
      }
    }
    SL_ERROR(logger_,
             "No valid private key drawn in {} attempts",
             kMaxKeygenAttempts);
    return Secp256k1ProviderError::KEYGEN_FAILED;
  }

  outcome::result<Secp256k1Keypair> Secp256k1ProviderImpl::deriveKeypair(
      const Secp256k1PrivateKey &secret_key) const {
    if (secp256k1_ec_seckey_verify(context_.get(), secret_key.data()) == 0) {
      return Secp256k1ProviderError::INVALID_PRIVATE_KEY;
    }
    Secp256k1Keypair keys;
    keys.secret_key = secret_key;
    secp256k1_pubkey ffi_pub;
    if (secp256k1_ec_pubkey_create(
            context_.get(), &ffi_pub, keys.secret_key.data())
        == 0) {
      return Secp256k1ProviderError::DERIVE_FAILED;
    }
    size_t size = Secp256k1PublicKey::size();
    if (secp256k1_ec_pubkey_serialize(context_.get(),
                                      keys.public_key.data(),
                                      &size,
                                      &ffi_pub,
                                      SECP256K1_EC_COMPRESSED)
        == 0) {
      return Secp256k1ProviderError::DERIVE_FAILED;
    }
    return keys;
  }

  outcome::result<Secp256k1Signature> Secp256k1ProviderImpl::sign(
      common::BufferView message,
      const Secp256k1PrivateKey &secret_key) const {
    auto digest = sha256(message);
    secp256k1_ecdsa_signature ffi_sig;
    // secp256k1_ecdsa_sign always produces a lower-S signature
    if (secp256k1_ecdsa_sign(context_.get(),
                             &ffi_sig,
                             digest.data(),
                             secret_key.data(),
                             secp256k1_nonce_function_rfc6979,
                             nullptr)
        == 0) {
      return Secp256k1ProviderError::SIGN_FAILED;
    }
    std::array<uint8_t, constants::secp256k1::MAX_DER_SIGNATURE_SIZE> der{};
    size_t der_size = der.size();
    if (secp256k1_ecdsa_signature_serialize_der(
            context_.get(), der.data(), &der_size, &ffi_sig)
        == 0) {
      return Secp256k1ProviderError::SIGN_FAILED;
    }
    return Secp256k1Signature(der.data(), der.data() + der_size);
  }

  outcome::result<bool> Secp256k1ProviderImpl::verify(
      common::BufferView message,
      common::BufferView signature,
      common::BufferView public_key) const {
    if (signature.empty()) {
      return Secp256k1ProviderError::INVALID_SIGNATURE;
    }
    if (public_key.empty()) {
      return Secp256k1ProviderError::INVALID_PUBLIC_KEY;
    }
    secp256k1_ecdsa_signature ffi_sig;
    if (secp256k1_ecdsa_signature_parse_der(
            context_.get(), &ffi_sig, signature.data(), signature.size())
        == 0) {
      return Secp256k1ProviderError::INVALID_SIGNATURE;
    }
    secp256k1_pubkey ffi_pub;
    if (secp256k1_ec_pubkey_parse(
            context_.get(), &ffi_pub, public_key.data(), public_key.size())
        == 0) {
      return Secp256k1ProviderError::INVALID_PUBLIC_KEY;
    }
    auto digest = sha256(message);
    // high-S signatures are rejected, they are never produced by sign()
    return secp256k1_ecdsa_verify(
               context_.get(), &ffi_sig, digest.data(), &ffi_pub)
        == 1;
  }

}  // namespace peerkeys::crypto
