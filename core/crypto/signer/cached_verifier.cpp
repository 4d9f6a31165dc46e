/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signer/cached_verifier.hpp"

#include <boost/assert.hpp>

namespace peerkeys::crypto {

  CachedVerifier::CachedVerifier(std::shared_ptr<MessageSigner> signer,
                                 std::shared_ptr<VerificationCache> cache)
      : signer_{std::move(signer)},
        cache_{std::move(cache)},
        logger_{log::createLogger("CachedVerifier", "signer")} {
    BOOST_ASSERT(signer_ != nullptr);
    BOOST_ASSERT(cache_ != nullptr);
  }

  outcome::result<bool> CachedVerifier::verify(std::string_view signature,
                                               std::string_view public_key,
                                               common::BufferView data) {
    if (signature.empty()) {
      return MessageSignerError::NO_SIGNATURE;
    }
    if (public_key.empty()) {
      return MessageSignerError::NO_PUBLIC_KEY;
    }
    if (data.empty()) {
      return MessageSignerError::NO_INPUT_DATA;
    }

    if (auto cached = cache_->get(signature)) {
      SL_TRACE(logger_, "Signature found in cache");
      const auto &message = cached->get();
      return message.public_key == public_key and message.data.view() == data;
    }

    OUTCOME_TRY(verified, signer_->verify(signature, public_key, data));
    // failures are not remembered
    if (verified) {
      cache_->put(signature,
                  VerifiedMessage{std::string{public_key},
                                  common::Buffer(data)});
    }
    return verified;
  }

  outcome::result<bool> CachedVerifier::verify(std::string_view signature,
                                               std::string_view public_key,
                                               std::string_view data) {
    return verify(
        signature, public_key, common::BufferView::fromString(data));
  }

}  // namespace peerkeys::crypto
