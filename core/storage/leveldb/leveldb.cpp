/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/leveldb/leveldb.hpp"

#include <leveldb/write_batch.h>

#include "storage/leveldb/leveldb_logger.hpp"
#include "storage/leveldb/leveldb_util.hpp"
#include "utils/mkdirs.hpp"

namespace peerkeys::storage {
  namespace fs = std::filesystem;

  LevelDB::~LevelDB() = default;

  outcome::result<std::shared_ptr<LevelDB>> LevelDB::create(
      const fs::path &path, leveldb::Options options) {
    auto log = log::createLogger("LevelDB", "leveldb");

    if (auto res = mkdirs(path); res.has_error()) {
      log->error("Can't create directory {} for database: {}",
                 path.native(),
                 res.error().message());
      return DatabaseError::DB_PATH_NOT_CREATED;
    }

    std::error_code ec;
    auto absolute_path = fs::absolute(path, ec);
    if (ec or not fs::is_directory(absolute_path, ec)) {
      log->error("Can't open {} for database: is not a directory",
                 path.native());
      return DatabaseError::IO_ERROR;
    }

    std::shared_ptr<LevelDB> l{new LevelDB()};
    l->path_ = absolute_path;
    l->info_log_ = std::make_unique<Logger>(
        log::createLogger("LevelDBInternal", "leveldb"));
    if (options.info_log == nullptr) {
      options.info_log = l->info_log_.get();
    }
    options.create_if_missing = true;

    leveldb::DB *db = nullptr;
    auto status = leveldb::DB::Open(options, absolute_path.native(), &db);
    if (not status.ok()) {
      log->error("Can't open database in {}: {}",
                 absolute_path.native(),
                 status.ToString());
      return error_as_result<std::shared_ptr<LevelDB>>(status);
    }

    l->db_ = std::unique_ptr<leveldb::DB>(db);
    l->logger_ = std::move(log);
    SL_DEBUG(l->logger_, "Database opened in {}", absolute_path.native());
    return l;
  }

  outcome::result<Buffer> LevelDB::get(const BufferView &key) const {
    if (not db_) {
      return DatabaseError::STORAGE_GONE;
    }
    std::string value;
    auto status = db_->Get(ro_, make_slice(key), &value);
    if (status.ok()) {
      return Buffer::fromString(value);
    }

    // not always an actual error so don't log it
    if (status.IsNotFound()) {
      return error_as_result<Buffer>(status);
    }

    return error_as_result<Buffer>(status, logger_);
  }

  outcome::result<std::optional<Buffer>> LevelDB::tryGet(
      const BufferView &key) const {
    auto res = get(key);
    if (res.has_value()) {
      return std::optional<Buffer>{std::move(res.value())};
    }
    if (res.error() == DatabaseError::NOT_FOUND) {
      return std::nullopt;
    }
    return res.error();
  }

  outcome::result<bool> LevelDB::contains(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<void> LevelDB::put(const BufferView &key, Buffer value) {
    if (not db_) {
      return DatabaseError::STORAGE_GONE;
    }
    auto status = db_->Put(wo_, make_slice(key), make_slice(value.view()));
    if (status.ok()) {
      return outcome::success();
    }

    return error_as_result<void>(status, logger_);
  }

  outcome::result<void> LevelDB::remove(const BufferView &key) {
    if (not db_) {
      return DatabaseError::STORAGE_GONE;
    }
    auto status = db_->Delete(wo_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return error_as_result<void>(status, logger_);
  }

  outcome::result<void> LevelDB::clear() {
    if (not db_) {
      return DatabaseError::STORAGE_GONE;
    }
    leveldb::WriteBatch batch;
    auto it = std::unique_ptr<leveldb::Iterator>(db_->NewIterator(ro_));
    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      batch.Delete(it->key());
      ++count;
    }
    if (not it->status().ok()) {
      return error_as_result<void>(it->status(), logger_);
    }
    it.reset();

    auto status = db_->Write(wo_, &batch);
    if (not status.ok()) {
      return error_as_result<void>(status, logger_);
    }
    SL_DEBUG(logger_, "Removed {} entries from {}", count, path_.native());
    return outcome::success();
  }

  outcome::result<void> LevelDB::close() {
    if (db_) {
      db_.reset();
      SL_DEBUG(logger_, "Database in {} closed", path_.native());
    }
    return outcome::success();
  }

}  // namespace peerkeys::storage
