/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/database_error.hpp"

namespace peerkeys::storage {

  outcome::result<Buffer> InMemoryStorage::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value) {
      return DatabaseError::NOT_FOUND;
    }
    return std::move(*value);
  }

  outcome::result<std::optional<Buffer>> InMemoryStorage::tryGet(
      const BufferView &key) const {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    if (auto it = storage_.find(key.toStringView()); it != storage_.end()) {
      return std::optional<Buffer>{it->second};
    }
    return std::nullopt;
  }

  outcome::result<bool> InMemoryStorage::contains(const BufferView &key) const {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    return storage_.find(key.toStringView()) != storage_.end();
  }

  outcome::result<void> InMemoryStorage::put(const BufferView &key,
                                             Buffer value) {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    storage_.insert_or_assign(std::string{key.toStringView()},
                              std::move(value));
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(const BufferView &key) {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    if (auto it = storage_.find(key.toStringView()); it != storage_.end()) {
      storage_.erase(it);
    }
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::clear() {
    if (closed_) {
      return DatabaseError::STORAGE_GONE;
    }
    storage_.clear();
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::close() {
    storage_.clear();
    closed_ = true;
    return outcome::success();
  }

  size_t InMemoryStorage::size() const {
    return storage_.size();
  }
}  // namespace peerkeys::storage
