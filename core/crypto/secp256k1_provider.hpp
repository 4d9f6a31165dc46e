/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1_types.hpp"
#include "outcome/outcome.hpp"

namespace peerkeys::crypto {

  /**
   * @class Secp256k1Provider provides key generation, ECDSA signing and
   * verification over the secp256k1 curve
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief generates a fresh keypair from the cryptographic random source
     */
    virtual outcome::result<Secp256k1Keypair> generateKeypair() const = 0;

    /**
     * @brief restores a keypair by deriving the public key
     * @param secret_key private key, must be a valid secp256k1 scalar
     */
    virtual outcome::result<Secp256k1Keypair> deriveKeypair(
        const Secp256k1PrivateKey &secret_key) const = 0;

    /**
     * @brief signs SHA-256 of the message, nonce is chosen deterministically
     * (RFC 6979) and the signature is normalized to low S
     * @return DER encoded signature
     */
    virtual outcome::result<Secp256k1Signature> sign(
        common::BufferView message,
        const Secp256k1PrivateKey &secret_key) const = 0;

    /**
     * @brief checks a DER encoded signature of SHA-256 of the message
     * @param public_key SEC1 encoded public key, compressed or not
     * @return true if signature is valid, false if it was rejected or error
     * if signature or public key can not be parsed
     */
    virtual outcome::result<bool> verify(
        common::BufferView message,
        common::BufferView signature,
        common::BufferView public_key) const = 0;
  };

}  // namespace peerkeys::crypto
