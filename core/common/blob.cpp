/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(peerkeys::common, BlobError, e) {
  using peerkeys::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Provided data has unexpected length";
  }
  return "Unknown BlobError";
}
