/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "crypto/secp256k1_provider.hpp"
#include "log/logger.hpp"

namespace peerkeys::crypto {

  enum class MessageSignerError {
    NO_SIGNING_KEY = 1,
    NO_SIGNATURE,
    NO_PUBLIC_KEY,
    NO_INPUT_DATA,
  };

  /**
   * Signs data with a keypair and checks signatures against hex encoded
   * public keys. Signatures are DER encoded ECDSA over SHA-256 of the data,
   * passed around as lowercase hex.
   */
  class MessageSigner {
   public:
    explicit MessageSigner(std::shared_ptr<Secp256k1Provider> provider);

    /**
     * @return hex encoded signature of \param data, same for the same key and
     * data
     */
    outcome::result<std::string> sign(const Secp256k1Keypair *keypair,
                                      common::BufferView data) const;

    /**
     * Signs bytes of the string \param data
     */
    outcome::result<std::string> sign(const Secp256k1Keypair *keypair,
                                      std::string_view data) const;

    /**
     * @return true if \param signature is a signature of \param data made
     * with the key \param public_key. Malformed signature or key yield false.
     */
    outcome::result<bool> verify(std::string_view signature,
                                 std::string_view public_key,
                                 common::BufferView data) const;

    /**
     * Verifies a signature of bytes of the string \param data
     */
    outcome::result<bool> verify(std::string_view signature,
                                 std::string_view public_key,
                                 std::string_view data) const;

   private:
    std::shared_ptr<Secp256k1Provider> provider_;
    log::Logger logger_;
  };

}  // namespace peerkeys::crypto

OUTCOME_HPP_DECLARE_ERROR(peerkeys::crypto, MessageSignerError);
