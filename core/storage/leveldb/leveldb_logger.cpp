/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/leveldb/leveldb_logger.hpp"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <vector>

namespace peerkeys::storage {

  LevelDB::Logger::Logger(log::Logger logger) : logger_(std::move(logger)) {}

  void LevelDB::Logger::Logv(const char *format, va_list ap) {
    if (logger_->level() < log::Level::DEBUG) {
      return;
    }

    std::array<char, 500> buffer{};
    va_list backup_ap;
    va_copy(backup_ap, ap);
    auto len = vsnprintf(buffer.data(), buffer.size(), format, backup_ap);
    va_end(backup_ap);
    if (len < 0) {
      return;
    }

    std::string_view message;
    std::vector<char> large;
    if (static_cast<size_t>(len) < buffer.size()) {
      message = std::string_view{buffer.data(), static_cast<size_t>(len)};
    } else {
      // retry with exactly enough space
      large.resize(static_cast<size_t>(len) + 1);
      va_copy(backup_ap, ap);
      vsnprintf(large.data(), large.size(), format, backup_ap);
      va_end(backup_ap);
      message = std::string_view{large.data(), static_cast<size_t>(len)};
    }

    while (not message.empty() and message.back() == '\n') {
      message.remove_suffix(1);
    }
    logger_->debug("{}", message);
  }

}  // namespace peerkeys::storage
