/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signer/verification_cache.hpp"

namespace peerkeys::crypto {

  VerificationCache::VerificationCache(size_t capacity) : lru_{capacity} {}

  std::optional<std::reference_wrapper<const VerifiedMessage>>
  VerificationCache::get(std::string_view signature) {
    if (auto message = lru_.get(std::string{signature})) {
      return std::cref(message->get());
    }
    return std::nullopt;
  }

  void VerificationCache::put(std::string_view signature,
                              VerifiedMessage message) {
    lru_.put(std::string{signature}, std::move(message));
  }

  void VerificationCache::clear() {
    lru_.clear();
  }

  size_t VerificationCache::size() const {
    return lru_.size();
  }

  size_t VerificationCache::capacity() const {
    return lru_.capacity();
  }

}  // namespace peerkeys::crypto
