/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/lru.hpp"

#include <gtest/gtest.h>

using peerkeys::Lru;

TEST(LruTest, OldestUsedPreempted) {
  Lru<int, int> cache{3};

  cache.put(1, 42);
  cache.put(2, 42);
  cache.put(3, 42);
  ASSERT_TRUE(cache.get(1).has_value());
  ASSERT_TRUE(cache.get(1).has_value());
  ASSERT_TRUE(cache.get(2).has_value());

  cache.put(4, 42);
  cache.put(5, 42);

  ASSERT_FALSE(cache.get(1).has_value());
  ASSERT_TRUE(cache.get(2).has_value());
  ASSERT_FALSE(cache.get(3).has_value());
  ASSERT_TRUE(cache.get(4).has_value());
  ASSERT_TRUE(cache.get(5).has_value());
  ASSERT_EQ(cache.size(), 3);
}

TEST(LruTest, PutRefreshesEntry) {
  Lru<int, int> cache{2};
  cache.put(1, 1);
  cache.put(2, 2);
  cache.put(1, 10);
  cache.put(3, 3);

  ASSERT_FALSE(cache.contains(2));
  ASSERT_EQ(cache.get(1)->get(), 10);
  ASSERT_EQ(cache.get(3)->get(), 3);
}

TEST(LruTest, EraseAndClear) {
  Lru<int, int> cache{2};
  cache.put(1, 1);
  cache.put(2, 2);
  cache.erase(1);
  ASSERT_FALSE(cache.contains(1));
  ASSERT_EQ(cache.size(), 1);

  cache.put(3, 3);
  cache.put(4, 4);
  ASSERT_FALSE(cache.contains(2));

  cache.clear();
  ASSERT_EQ(cache.size(), 0);
  cache.put(5, 5);
  ASSERT_EQ(cache.get(5)->get(), 5);
}

TEST(LruTest, ZeroCapacityRejected) {
  ASSERT_THROW((Lru<int, int>{0}), std::length_error);
}
