/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1_types.hpp"

namespace peerkeys::crypto {

  bool Secp256k1Keypair::operator==(const Secp256k1Keypair &other) const {
    return secret_key == other.secret_key and public_key == other.public_key;
  }

  bool Secp256k1Keypair::operator!=(const Secp256k1Keypair &other) const {
    return !(*this == other);
  }

}  // namespace peerkeys::crypto
