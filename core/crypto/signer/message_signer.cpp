/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signer/message_signer.hpp"

#include <boost/assert.hpp>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(peerkeys::crypto, MessageSignerError, e) {
  using E = peerkeys::crypto::MessageSignerError;
  switch (e) {
    case E::NO_SIGNING_KEY:
      return "No signing key given";
    case E::NO_SIGNATURE:
      return "No signature given";
    case E::NO_PUBLIC_KEY:
      return "No public key given";
    case E::NO_INPUT_DATA:
      return "Given input data was undefined";
  }
  return "Unknown MessageSignerError";
}

namespace peerkeys::crypto {

  MessageSigner::MessageSigner(std::shared_ptr<Secp256k1Provider> provider)
      : provider_{std::move(provider)},
        logger_{log::createLogger("MessageSigner", "signer")} {
    BOOST_ASSERT(provider_ != nullptr);
  }

  outcome::result<std::string> MessageSigner::sign(
      const Secp256k1Keypair *keypair, common::BufferView data) const {
    if (keypair == nullptr) {
      return MessageSignerError::NO_SIGNING_KEY;
    }
    if (data.empty()) {
      return MessageSignerError::NO_INPUT_DATA;
    }
    OUTCOME_TRY(signature, provider_->sign(data, keypair->secret_key));
    return signature.toHex();
  }

  outcome::result<std::string> MessageSigner::sign(
      const Secp256k1Keypair *keypair, std::string_view data) const {
    return sign(keypair, common::BufferView::fromString(data));
  }

  outcome::result<bool> MessageSigner::verify(std::string_view signature,
                                              std::string_view public_key,
                                              common::BufferView data) const {
    if (signature.empty()) {
      return MessageSignerError::NO_SIGNATURE;
    }
    if (public_key.empty()) {
      return MessageSignerError::NO_PUBLIC_KEY;
    }
    if (data.empty()) {
      return MessageSignerError::NO_INPUT_DATA;
    }

    auto signature_bytes = common::unhex(signature);
    if (signature_bytes.has_error()) {
      SL_DEBUG(logger_,
               "Signature is not hex: {}",
               signature_bytes.error().message());
      return false;
    }
    auto public_key_bytes = common::unhex(public_key);
    if (public_key_bytes.has_error()) {
      SL_DEBUG(logger_,
               "Public key is not hex: {}",
               public_key_bytes.error().message());
      return false;
    }

    auto verified = provider_->verify(
        data,
        common::BufferView(std::span<const uint8_t>(signature_bytes.value())),
        common::BufferView(std::span<const uint8_t>(public_key_bytes.value())));
    if (verified.has_error()) {
      SL_DEBUG(logger_, "Signature rejected: {}", verified.error().message());
      return false;
    }
    return verified.value();
  }

  outcome::result<bool> MessageSigner::verify(std::string_view signature,
                                              std::string_view public_key,
                                              std::string_view data) const {
    return verify(
        signature, public_key, common::BufferView::fromString(data));
  }

}  // namespace peerkeys::crypto
