/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/random/random_device.hpp>

#include "crypto/random_generator.hpp"

namespace peerkeys::crypto {

  /**
   * @brief CSPRNG over boost::random_device, which reads the OS entropy
   * source (/dev/urandom on Linux)
   */
  class BoostRandomGenerator : public CSPRNG {
   public:
    void fillRandomly(std::span<uint8_t> out) override;

   private:
    boost::random_device generator_;
  };

}  // namespace peerkeys::crypto
