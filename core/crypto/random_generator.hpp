/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>

namespace peerkeys::crypto {

  /**
   * @brief random generator interface
   */
  class RandomGenerator {
   public:
    virtual ~RandomGenerator() = default;

    /**
     * @brief fills the whole of `out` with random bytes
     */
    virtual void fillRandomly(std::span<uint8_t> out) = 0;
  };

  /**
   * @brief cryptographically secure random generator, used for secret keys
   */
  class CSPRNG : public RandomGenerator {};

}  // namespace peerkeys::crypto
