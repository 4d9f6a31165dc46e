/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/composed/composed_storage.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/core/storage/buffer_storage_mock.hpp"
#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/lru/lru_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using peerkeys::common::Buffer;
using peerkeys::common::BufferView;
using peerkeys::storage::BufferStorageMock;
using peerkeys::storage::ComposedStorage;
using peerkeys::storage::DatabaseError;
using peerkeys::storage::InMemoryStorage;
using peerkeys::storage::LruStorage;

using ::testing::_;
using ::testing::Return;

class ComposedStorageTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    cache_ = std::make_shared<LruStorage>(2);
    persistent_ = std::make_shared<InMemoryStorage>();
    storage_ = std::make_shared<ComposedStorage>(cache_, persistent_);
  }

 protected:
  std::shared_ptr<LruStorage> cache_;
  std::shared_ptr<InMemoryStorage> persistent_;
  std::shared_ptr<ComposedStorage> storage_;
};

/**
 * @given empty composed storage
 * @when a value is put
 * @then it lands in both tiers
 */
TEST_F(ComposedStorageTest, PutWritesBothTiers) {
  EXPECT_OUTCOME_TRUE_1(storage_->put("key"_buf, "value"_buf));
  EXPECT_OUTCOME_TRUE(cached, cache_->get("key"_buf));
  EXPECT_EQ(cached, "value"_buf);
  EXPECT_OUTCOME_TRUE(stored, persistent_->get("key"_buf));
  EXPECT_EQ(stored, "value"_buf);
}

/**
 * @given value present only in the persistent tier
 * @when it is read through composed storage
 * @then the value is returned and the cache is populated
 */
TEST_F(ComposedStorageTest, ReadThroughPopulatesCache) {
  EXPECT_OUTCOME_TRUE_1(persistent_->put("key"_buf, "value"_buf));
  EXPECT_OUTCOME_TRUE(cached_before, cache_->contains("key"_buf));
  EXPECT_FALSE(cached_before);

  EXPECT_OUTCOME_TRUE(value, storage_->get("key"_buf));
  EXPECT_EQ(value, "value"_buf);

  EXPECT_OUTCOME_TRUE(cached_after, cache_->contains("key"_buf));
  EXPECT_TRUE(cached_after);
}

/**
 * @given value evicted from the cache
 * @when it is read through composed storage
 * @then it is served from the persistent tier
 */
TEST_F(ComposedStorageTest, EvictedValueServedFromPersistent) {
  EXPECT_OUTCOME_TRUE_1(storage_->put("a"_buf, "1"_buf));
  EXPECT_OUTCOME_TRUE_1(storage_->put("b"_buf, "2"_buf));
  EXPECT_OUTCOME_TRUE_1(storage_->put("c"_buf, "3"_buf));
  EXPECT_OUTCOME_TRUE(cached, cache_->contains("a"_buf));
  EXPECT_FALSE(cached);

  EXPECT_OUTCOME_TRUE(value, storage_->get("a"_buf));
  EXPECT_EQ(value, "1"_buf);
}

/**
 * @given empty composed storage
 * @when missing key is read
 * @then get fails with NOT_FOUND, tryGet returns nothing
 */
TEST_F(ComposedStorageTest, Missing) {
  EXPECT_EC(storage_->get("key"_buf), DatabaseError::NOT_FOUND);
  EXPECT_OUTCOME_TRUE(value, storage_->tryGet("key"_buf));
  EXPECT_FALSE(value.has_value());
  EXPECT_OUTCOME_TRUE(contains, storage_->contains("key"_buf));
  EXPECT_FALSE(contains);
}

/**
 * @given composed storage with values
 * @when one is removed and then everything is cleared
 * @then both tiers are emptied
 */
TEST_F(ComposedStorageTest, RemoveAndClear) {
  EXPECT_OUTCOME_TRUE_1(storage_->put("a"_buf, "1"_buf));
  EXPECT_OUTCOME_TRUE_1(storage_->put("b"_buf, "2"_buf));

  EXPECT_OUTCOME_TRUE_1(storage_->remove("a"_buf));
  EXPECT_EC(storage_->get("a"_buf), DatabaseError::NOT_FOUND);
  EXPECT_EQ(persistent_->size(), 1);

  EXPECT_OUTCOME_TRUE_1(storage_->clear());
  EXPECT_EQ(cache_->size(), 0);
  EXPECT_EQ(persistent_->size(), 0);
}

/**
 * @given composed storage
 * @when it is closed twice
 * @then both closes succeed and further calls fail with STORAGE_GONE
 */
TEST_F(ComposedStorageTest, Close) {
  EXPECT_OUTCOME_TRUE_1(storage_->close());
  EXPECT_OUTCOME_TRUE_1(storage_->close());
  EXPECT_EC(storage_->get("a"_buf), DatabaseError::STORAGE_GONE);
  EXPECT_EC(storage_->put("a"_buf, "1"_buf), DatabaseError::STORAGE_GONE);
}

/**
 * @given persistent tier failing writes
 * @when a value is put
 * @then the error is returned and the cache stays untouched
 */
TEST(ComposedStorageFaultTest, FailedPersistentWriteLeavesCacheUntouched) {
  testutil::prepareLoggers();
  auto cache = std::make_shared<LruStorage>(10);
  auto persistent = std::make_shared<BufferStorageMock>();
  ComposedStorage storage{cache, persistent};

  EXPECT_CALL(*persistent, put(_, _))
      .WillOnce(Return(outcome::failure(DatabaseError::IO_ERROR)));

  EXPECT_EC(storage.put("key"_buf, "value"_buf), DatabaseError::IO_ERROR);
  EXPECT_OUTCOME_TRUE(cached, cache->contains("key"_buf));
  EXPECT_FALSE(cached);
}

/**
 * @given persistent tier failing reads
 * @when a value missing in the cache is read
 * @then the fault propagates instead of being reported as absence
 */
TEST(ComposedStorageFaultTest, PersistentReadFaultPropagates) {
  testutil::prepareLoggers();
  auto cache = std::make_shared<LruStorage>(10);
  auto persistent = std::make_shared<BufferStorageMock>();
  ComposedStorage storage{cache, persistent};

  EXPECT_CALL(*persistent, tryGet(_))
      .WillOnce(Return(outcome::failure(DatabaseError::CORRUPTION)));

  EXPECT_EC(storage.tryGet("key"_buf), DatabaseError::CORRUPTION);
}
