/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace peerkeys::storage::face {

  /**
   * @brief An abstraction over a readable, writeable key-value storage
   * which owns an external resource (file handles, memory).
   * Every call after close() fails with DatabaseError::STORAGE_GONE.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>, Writeable<K, V> {
    /**
     * @brief Remove every entry of the storage
     */
    virtual outcome::result<void> clear() = 0;

    /**
     * @brief Release underlying resources, terminal for this instance.
     * Closing an already closed storage succeeds.
     */
    virtual outcome::result<void> close() = 0;
  };

}  // namespace peerkeys::storage::face
