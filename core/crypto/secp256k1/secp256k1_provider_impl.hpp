/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/random_generator.hpp"
#include "crypto/secp256k1_provider.hpp"
#include "log/logger.hpp"

namespace peerkeys::crypto {

  enum class Secp256k1ProviderError {
    INVALID_PRIVATE_KEY = 1,
    INVALID_PUBLIC_KEY,
    INVALID_SIGNATURE,
    SIGN_FAILED,
    DERIVE_FAILED,
    KEYGEN_FAILED,
  };

  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    /// attempts to draw a valid scalar before giving up
    static constexpr size_t kMaxKeygenAttempts = 16;

    explicit Secp256k1ProviderImpl(std::shared_ptr<CSPRNG> random_generator);

    ~Secp256k1ProviderImpl() override = default;

    outcome::result<Secp256k1Keypair> generateKeypair() const override;

    outcome::result<Secp256k1Keypair> deriveKeypair(
        const Secp256k1PrivateKey &secret_key) const override;

    outcome::result<Secp256k1Signature> sign(
        common::BufferView message,
        const Secp256k1PrivateKey &secret_key) const override;

    outcome::result<bool> verify(common::BufferView message,
                                 common::BufferView signature,
                                 common::BufferView public_key) const override;

   private:
    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
    std::shared_ptr<CSPRNG> random_generator_;
    log::Logger logger_;
  };
}  // namespace peerkeys::crypto

OUTCOME_HPP_DECLARE_ERROR(peerkeys::crypto, Secp256k1ProviderError);
