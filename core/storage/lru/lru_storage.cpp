/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/lru/lru_storage.hpp"

#include "storage/database_error.hpp"

namespace peerkeys::storage {

  LruStorage::LruStorage(size_t capacity) : lru_{capacity} {}

  outcome::result<Buffer> LruStorage::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value) {
      return DatabaseError::NOT_FOUND;
    }
    return std::move(*value);
  }

  outcome::result<std::optional<Buffer>> LruStorage::tryGet(
      const BufferView &key) const {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    if (auto value = lru_.get(Buffer(key))) {
      return std::optional<Buffer>{value->get()};
    }
    return std::nullopt;
  }

  outcome::result<bool> LruStorage::contains(const BufferView &key) const {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    return lru_.contains(Buffer(key));
  }

  outcome::result<void> LruStorage::put(const BufferView &key, Buffer value) {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    lru_.put(Buffer(key), std::move(value));
    return outcome::success();
  }

  outcome::result<void> LruStorage::remove(const BufferView &key) {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    lru_.erase(Buffer(key));
    return outcome::success();
  }

  outcome::result<void> LruStorage::clear() {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    lru_.clear();
    return outcome::success();
  }

  outcome::result<void> LruStorage::close() {
    lru_.clear();
    closed_ = true;
    return outcome::success();
  }

  size_t LruStorage::size() const {
    return lru_.size();
  }

  size_t LruStorage::capacity() const {
    return lru_.capacity();
  }
}  // namespace peerkeys::storage
