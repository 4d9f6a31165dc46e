/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <leveldb/db.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"

namespace peerkeys::storage {

  /**
   * @brief An implementation of BufferStorage interface, which uses
   * LevelDB as underlying storage.
   */
  class LevelDB : public BufferStorage {
   public:
    class Logger;

    ~LevelDB() override;

    /**
     * @brief Factory method to create an instance of LevelDB class.
     * @param path filesystem path where database is going to be, missing
     * directories are created
     * @param options leveldb options, such as caching, logging, etc.
     * create_if_missing is always set
     * @return instance of LevelDB
     */
    static outcome::result<std::shared_ptr<LevelDB>> create(
        const std::filesystem::path &path,
        leveldb::Options options = leveldb::Options());

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

    outcome::result<void> clear() override;

    outcome::result<void> close() override;

   private:
    LevelDB() = default;

    std::filesystem::path path_;
    // must outlive db_, which writes into it
    std::unique_ptr<Logger> info_log_;
    std::unique_ptr<leveldb::DB> db_;
    leveldb::ReadOptions ro_;
    leveldb::WriteOptions wo_;
    log::Logger logger_;
  };

}  // namespace peerkeys::storage
