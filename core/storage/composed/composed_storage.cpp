/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/composed/composed_storage.hpp"

#include <boost/assert.hpp>

#include "storage/database_error.hpp"

namespace peerkeys::storage {

  ComposedStorage::ComposedStorage(std::shared_ptr<BufferStorage> cache,
                                   std::shared_ptr<BufferStorage> persistent)
      : cache_{std::move(cache)},
        persistent_{std::move(persistent)},
        logger_{log::createLogger("ComposedStorage", "storage")} {
    BOOST_ASSERT(cache_ != nullptr);
    BOOST_ASSERT(persistent_ != nullptr);
  }

  outcome::result<Buffer> ComposedStorage::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value) {
      return DatabaseError::NOT_FOUND;
    }
    return std::move(*value);
  }

  outcome::result<std::optional<Buffer>> ComposedStorage::tryGet(
      const BufferView &key) const {
    OUTCOME_TRY(cached, cache_->tryGet(key));
    if (cached) {
      SL_TRACE(logger_, "Cache hit for {}", key);
      return cached;
    }

    OUTCOME_TRY(stored, persistent_->tryGet(key));
    if (stored) {
      SL_TRACE(logger_, "Cache miss for {}, populated from storage", key);
      OUTCOME_TRY(cache_->put(key, *stored));
    }
    return stored;
  }

  outcome::result<bool> ComposedStorage::contains(
      const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<void> ComposedStorage::put(const BufferView &key,
                                             Buffer value) {
    OUTCOME_TRY(persistent_->put(key, value));
    return cache_->put(key, std::move(value));
  }

  outcome::result<void> ComposedStorage::remove(const BufferView &key) {
    OUTCOME_TRY(persistent_->remove(key));
    return cache_->remove(key);
  }

  outcome::result<void> ComposedStorage::clear() {
    OUTCOME_TRY(persistent_->clear());
    return cache_->clear();
  }

  outcome::result<void> ComposedStorage::close() {
    if (closed_) {
      return outcome::success();
    }
    closed_ = true;
    auto res = persistent_->close();
    OUTCOME_TRY(cache_->close());
    return res;
  }

}  // namespace peerkeys::storage
