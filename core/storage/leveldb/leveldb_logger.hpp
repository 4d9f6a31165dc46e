/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/leveldb/leveldb.hpp"

#include <leveldb/env.h>

namespace peerkeys::storage {

  /**
   * @brief Logger, which can be used to log LevelDB internal events.
   * @see leveldb::Options#info_log
   */
  class LevelDB::Logger : public leveldb::Logger {
   public:
    explicit Logger(log::Logger logger);

    void Logv(const char *format, va_list ap) override;

   private:
    log::Logger logger_;
  };

}  // namespace peerkeys::storage
