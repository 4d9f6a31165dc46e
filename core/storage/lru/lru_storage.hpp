/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/buffer_map_types.hpp"
#include "utils/lru.hpp"

namespace peerkeys::storage {

  /**
   * Volatile BufferStorage of bounded capacity, evicting the least recently
   * used entry when full. Reads refresh recency of the entry.
   */
  class LruStorage : public BufferStorage {
   public:
    static constexpr size_t kDefaultCapacity = 1000;

    /**
     * @param capacity max number of entries, must be positive
     * @throws std::length_error on zero capacity
     */
    explicit LruStorage(size_t capacity = kDefaultCapacity);

    ~LruStorage() override = default;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

    outcome::result<void> clear() override;

    outcome::result<void> close() override;

    size_t size() const;

    size_t capacity() const;

   private:
    // reads reorder entries
    mutable Lru<Buffer, Buffer> lru_;
    bool closed_ = false;
  };

}  // namespace peerkeys::storage
