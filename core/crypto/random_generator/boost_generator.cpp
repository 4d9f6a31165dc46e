/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random_generator/boost_generator.hpp"

#include <algorithm>
#include <cstring>

namespace peerkeys::crypto {

  void BoostRandomGenerator::fillRandomly(std::span<uint8_t> out) {
    while (not out.empty()) {
      auto word = generator_();
      auto n = std::min(sizeof(word), out.size());
      std::memcpy(out.data(), &word, n);
      out = out.subspan(n);
    }
  }

}  // namespace peerkeys::crypto
