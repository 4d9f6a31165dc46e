/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include "storage/buffer_map_types.hpp"

namespace peerkeys::storage {

  /**
   * Simple unbounded storage that conforms BufferStorage interface.
   * Used as a persistent tier replacement in tests and wherever a key store
   * must not touch the filesystem.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

    outcome::result<void> clear() override;

    outcome::result<void> close() override;

    size_t size() const;

   private:
    std::map<std::string, Buffer, std::less<>> storage_;
    bool closed_ = false;
  };

}  // namespace peerkeys::storage
