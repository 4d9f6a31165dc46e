/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"

namespace peerkeys::storage {

  /**
   * Two-tier storage: a volatile cache in front of a persistent storage.
   * Reads go to the cache first and populate it from the persistent tier on
   * miss. Writes go to the persistent tier first, the cache is updated only
   * after the persistent write succeeded.
   */
  class ComposedStorage : public BufferStorage {
   public:
    ComposedStorage(std::shared_ptr<BufferStorage> cache,
                    std::shared_ptr<BufferStorage> persistent);

    ~ComposedStorage() override = default;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

    outcome::result<void> clear() override;

    outcome::result<void> close() override;

   private:
    std::shared_ptr<BufferStorage> cache_;
    std::shared_ptr<BufferStorage> persistent_;
    bool closed_ = false;
    log::Logger logger_;
  };

}  // namespace peerkeys::storage
