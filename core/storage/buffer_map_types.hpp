/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * This file contains convenience typedefs for interfaces from face/, as they
 * are mostly used with Buffer key and value types
 */

#include "common/buffer.hpp"
#include "storage/face/generic_storage.hpp"

namespace peerkeys::storage::face {
  template <>
  struct ViewTrait<common::Buffer> {
    using type = common::BufferView;
  };
}  // namespace peerkeys::storage::face

namespace peerkeys::storage {
  using common::Buffer;
  using common::BufferView;

  using BufferStorage = face::GenericStorage<Buffer, Buffer>;
}  // namespace peerkeys::storage
