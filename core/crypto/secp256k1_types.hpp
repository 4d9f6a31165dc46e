/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace peerkeys::crypto {
  namespace constants::secp256k1 {
    enum {
      PRIVKEY_SIZE = 32,
      PUBKEY_SIZE = 33,
      /// upper bound of a DER encoded ECDSA signature
      MAX_DER_SIGNATURE_SIZE = 72,
    };
  }  // namespace constants::secp256k1
}  // namespace peerkeys::crypto

PEERKEYS_BLOB_STRICT_TYPEDEF(peerkeys::crypto,
                             Secp256k1PrivateKey,
                             constants::secp256k1::PRIVKEY_SIZE);
/// compressed SEC1 encoding
PEERKEYS_BLOB_STRICT_TYPEDEF(peerkeys::crypto,
                             Secp256k1PublicKey,
                             constants::secp256k1::PUBKEY_SIZE);

namespace peerkeys::crypto {

  struct Secp256k1Keypair {
    Secp256k1PrivateKey secret_key;
    Secp256k1PublicKey public_key;

    bool operator==(const Secp256k1Keypair &other) const;
    bool operator!=(const Secp256k1Keypair &other) const;
  };

  /// DER encoded ECDSA signature
  using Secp256k1Signature = common::Buffer;

}  // namespace peerkeys::crypto
