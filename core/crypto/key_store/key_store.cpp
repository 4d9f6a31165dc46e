/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_store/key_store.hpp"

#include <boost/assert.hpp>
#include <openssl/crypto.h>

#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "storage/composed/composed_storage.hpp"
#include "storage/leveldb/leveldb.hpp"
#include "storage/lru/lru_storage.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(peerkeys::crypto, KeyStoreError, e) {
  using E = peerkeys::crypto::KeyStoreError;
  switch (e) {
    case E::CREATE_WITHOUT_ID:
      return "id needed to create a key";
    case E::GET_WITHOUT_ID:
      return "id needed to get a key";
    case E::CHECK_WITHOUT_ID:
      return "id needed to check a key";
    case E::ADD_WITHOUT_ID:
      return "id needed to add a key";
    case E::NO_KEYPAIR:
      return "No key pair given";
    case E::UNSUPPORTED_FORMAT:
      return "Supported formats are `hex` and `buffer`";
    case E::INVALID_STORED_KEY:
      return "Stored record is not a valid private key";
  }
  return "Unknown KeyStoreError";
}

namespace peerkeys::crypto {

  outcome::result<PublicKeyFormat> publicKeyFormatFromString(
      std::string_view name) {
    if (name == "hex") {
      return PublicKeyFormat::HEX;
    }
    if (name == "buffer") {
      return PublicKeyFormat::RAW;
    }
    return KeyStoreError::UNSUPPORTED_FORMAT;
  }

  outcome::result<std::shared_ptr<KeyStore>> KeyStore::create(
      const Config &config) {
    return create(config,
                  std::make_shared<Secp256k1ProviderImpl>(
                      std::make_shared<BoostRandomGenerator>()));
  }

  outcome::result<std::shared_ptr<KeyStore>> KeyStore::create(
      const Config &config, std::shared_ptr<Secp256k1Provider> provider) {
    OUTCOME_TRY(persistent, storage::LevelDB::create(config.path));
    auto cache = std::make_shared<storage::LruStorage>(config.cache_size);
    auto composed = std::make_shared<storage::ComposedStorage>(
        std::move(cache), std::move(persistent));
    return std::make_shared<KeyStore>(std::move(composed),
                                      std::move(provider));
  }

  KeyStore::KeyStore(std::shared_ptr<storage::BufferStorage> storage,
                     std::shared_ptr<Secp256k1Provider> provider)
      : storage_{std::move(storage)},
        provider_{std::move(provider)},
        logger_{log::createLogger("KeyStore", "key_store")} {
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(provider_ != nullptr);
  }

  common::Buffer KeyStore::recordKey(std::string_view id) {
    common::Buffer key;
    key.reserve(kPrivateKeyPrefix.size() + id.size());
    return std::move(key.put(kPrivateKeyPrefix).put(id));
  }

  outcome::result<Secp256k1Keypair> KeyStore::createKey(std::string_view id,
                                                        KeyOptions options) {
    if (id.empty()) {
      return KeyStoreError::CREATE_WITHOUT_ID;
    }
    auto keypair_res = options.entropy
                         ? provider_->deriveKeypair(*options.entropy)
                         : provider_->generateKeypair();
    OUTCOME_TRY(keypair, std::move(keypair_res));
    OUTCOME_TRY(addKey(id, keypair));
    SL_DEBUG(logger_, "Created key '{}': {}", id, keypair.public_key);
    return keypair;
  }

  outcome::result<void> KeyStore::addKey(std::string_view id,
                                         const Secp256k1Keypair &keypair) {
    if (id.empty()) {
      return KeyStoreError::ADD_WITHOUT_ID;
    }
    OUTCOME_TRY(storage_->put(recordKey(id),
                              common::Buffer(keypair.secret_key.view())));
    SL_TRACE(logger_, "Stored private key of '{}'", id);
    return outcome::success();
  }

  outcome::result<std::optional<Secp256k1Keypair>> KeyStore::getKey(
      std::string_view id) const {
    if (id.empty()) {
      return KeyStoreError::GET_WITHOUT_ID;
    }
    auto record_res = storage_->tryGet(recordKey(id));
    if (record_res.has_error()) {
      SL_ERROR(logger_,
               "Can't read key '{}': {}",
               id,
               record_res.error().message());
      return std::nullopt;
    }
    auto &record = record_res.value();
    // empty record is treated as absent, the same way hasKey does
    if (not record or record->empty()) {
      SL_TRACE(logger_, "No key '{}'", id);
      return std::nullopt;
    }

    auto secret_res = Secp256k1PrivateKey::fromSpan(*record);
    OPENSSL_cleanse(record->data(), record->size());
    if (secret_res.has_error()) {
      SL_ERROR(logger_, "Record of key '{}' has wrong size", id);
      return KeyStoreError::INVALID_STORED_KEY;
    }
    auto keypair_res = provider_->deriveKeypair(secret_res.value());
    OPENSSL_cleanse(secret_res.value().data(), secret_res.value().size());
    if (keypair_res.has_error()) {
      SL_ERROR(logger_,
               "Record of key '{}' is not a private key: {}",
               id,
               keypair_res.error().message());
      return KeyStoreError::INVALID_STORED_KEY;
    }
    return std::move(keypair_res.value());
  }

  outcome::result<bool> KeyStore::hasKey(std::string_view id) const {
    if (id.empty()) {
      return KeyStoreError::CHECK_WITHOUT_ID;
    }
    auto record_res = storage_->tryGet(recordKey(id));
    if (record_res.has_error()) {
      SL_ERROR(logger_,
               "Can't check key '{}': {}",
               id,
               record_res.error().message());
      return false;
    }
    auto &record = record_res.value();
    bool found = record.has_value() and not record->empty();
    if (record) {
      OPENSSL_cleanse(record->data(), record->size());
    }
    return found;
  }

  outcome::result<EncodedPublicKey> KeyStore::getPublicKey(
      const Secp256k1Keypair *keypair, PublicKeyFormat format) const {
    if (keypair == nullptr) {
      return KeyStoreError::NO_KEYPAIR;
    }
    switch (format) {
      case PublicKeyFormat::HEX:
        return EncodedPublicKey{keypair->public_key.toHex()};
      case PublicKeyFormat::RAW:
        return EncodedPublicKey{common::Buffer(keypair->public_key.view())};
    }
    return KeyStoreError::UNSUPPORTED_FORMAT;
  }

  outcome::result<void> KeyStore::clear() {
    OUTCOME_TRY(storage_->clear());
    SL_DEBUG(logger_, "All keys removed");
    return outcome::success();
  }

  outcome::result<void> KeyStore::close() {
    return storage_->close();
  }

}  // namespace peerkeys::crypto
