/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include <boost/assert.hpp>

namespace peerkeys {
  /**
   * `std::unordered_map` bounded by capacity with least-recently-used
   * eviction. `get` and `put` mark the entry as most recently used.
   * Not thread safe.
   */
  template <typename K, typename V>
  class Lru {
   public:
    struct Item;
    using Map = std::unordered_map<K, std::unique_ptr<Item>>;
    using It = typename Map::iterator;
    struct Item {
      V v;
      It more, less;
    };

    explicit Lru(size_t capacity) : capacity_{capacity} {
      if (capacity_ == 0) {
        throw std::length_error{"Lru(capacity=0)"};
      }
      // stored iterators must survive inserts, so no rehash below capacity
      map_.reserve(capacity_);
    }

    Lru(const Lru &) = delete;
    void operator=(const Lru &) = delete;

    size_t capacity() const {
      return capacity_;
    }

    size_t size() const {
      return map_.size();
    }

    std::optional<std::reference_wrapper<V>> get(const K &k) {
      auto it = map_.find(k);
      if (it == map_.end()) {
        return std::nullopt;
      }
      lru_use(it);
      return std::ref(it->second->v);
    }

    /// Does not affect recency
    bool contains(const K &k) const {
      return map_.contains(k);
    }

    V &put(const K &k, V v) {
      auto it = map_.find(k);
      if (it == map_.end()) {
        if (map_.size() >= capacity_) {
          lru_pop();
        }
        it = map_.emplace(k, std::make_unique<Item>(Item{std::move(v), {}, {}}))
                 .first;
        lru_push(it);
        return it->second->v;
      }
      it->second->v = std::move(v);
      lru_use(it);
      return it->second->v;
    }

    void erase(const K &k) {
      auto it = map_.find(k);
      if (it == map_.end()) {
        return;
      }
      lru_extract(*it->second);
      map_.erase(it);
    }

    void clear() {
      map_.clear();
      most_ = It{};
      least_ = It{};
    }

   private:
    static auto empty(const It &it) {
      return it == It{};
    }

    void lru_use(It it) {
      if (it == most_) {
        return;
      }
      lru_extract(*it->second);
      lru_push(it);
    }

    void lru_push(It it) {
      BOOST_ASSERT(empty(it->second->less));
      BOOST_ASSERT(empty(it->second->more));
      it->second->less = most_;
      if (not empty(most_)) {
        most_->second->more = it;
      }
      most_ = it;
      if (empty(least_)) {
        least_ = most_;
      }
    }

    void lru_extract(Item &v) {
      if (not empty(v.more)) {
        v.more->second->less = v.less;
      } else {
        most_ = v.less;
      }
      if (not empty(v.less)) {
        v.less->second->more = v.more;
      } else {
        least_ = v.more;
      }
      v.more = It{};
      v.less = It{};
    }

    void lru_pop() {
      auto it = least_;
      lru_extract(*it->second);
      map_.erase(it);
    }

    Map map_;
    size_t capacity_;
    It most_, least_;
  };
}  // namespace peerkeys
