/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "utils/lru.hpp"

namespace peerkeys::crypto {

  /// What a signature was successfully verified against
  struct VerifiedMessage {
    std::string public_key;
    common::Buffer data;
  };

  /**
   * Bounded map from a hex encoded signature to the public key and data it
   * was verified with. Holds successful verifications only.
   */
  class VerificationCache {
   public:
    static constexpr size_t kDefaultCapacity = 1000;

    /// @throws std::length_error on zero capacity
    explicit VerificationCache(size_t capacity = kDefaultCapacity);

    /// Reference is valid until the next put or clear
    std::optional<std::reference_wrapper<const VerifiedMessage>> get(
        std::string_view signature);

    void put(std::string_view signature, VerifiedMessage message);

    void clear();

    size_t size() const;

    size_t capacity() const;

   private:
    Lru<std::string, VerifiedMessage> lru_;
  };

}  // namespace peerkeys::crypto
