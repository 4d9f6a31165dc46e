/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/signer/message_signer.hpp"
#include "crypto/signer/verification_cache.hpp"

namespace peerkeys::crypto {

  /**
   * Signature verification memoized by signature. A signature seen before is
   * accepted without the cryptographic check if it comes with the same public
   * key and the same data it was verified with.
   */
  class CachedVerifier {
   public:
    CachedVerifier(std::shared_ptr<MessageSigner> signer,
                   std::shared_ptr<VerificationCache> cache);

    outcome::result<bool> verify(std::string_view signature,
                                 std::string_view public_key,
                                 common::BufferView data);

    outcome::result<bool> verify(std::string_view signature,
                                 std::string_view public_key,
                                 std::string_view data);

   private:
    std::shared_ptr<MessageSigner> signer_;
    std::shared_ptr<VerificationCache> cache_;
    log::Logger logger_;
  };

}  // namespace peerkeys::crypto
