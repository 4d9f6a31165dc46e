/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>

#include "crypto/secp256k1_provider.hpp"
#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"

namespace peerkeys::crypto {

  enum class KeyStoreError {
    CREATE_WITHOUT_ID = 1,
    GET_WITHOUT_ID,
    CHECK_WITHOUT_ID,
    ADD_WITHOUT_ID,
    NO_KEYPAIR,
    UNSUPPORTED_FORMAT,
    INVALID_STORED_KEY,
  };

  /// Encoding of a public key returned by KeyStore::getPublicKey
  enum class PublicKeyFormat {
    HEX,  ///< lowercase hex string
    RAW,  ///< compressed bytes
  };

  /**
   * Parses textual format name, "hex" or "buffer"
   */
  outcome::result<PublicKeyFormat> publicKeyFormatFromString(
      std::string_view name);

  using EncodedPublicKey = std::variant<std::string, common::Buffer>;

  struct KeyOptions {
    /// used as the private key instead of a freshly generated one
    std::optional<Secp256k1PrivateKey> entropy;
  };

  /**
   * Keeps secp256k1 keypairs of a peer by a textual identifier.
   * Only private keys are stored, public keys are derived on load.
   */
  class KeyStore {
   public:
    struct Config {
      std::filesystem::path path = kDefaultPath;
      size_t cache_size = kDefaultCacheSize;
    };

    static constexpr std::string_view kDefaultPath = "./keystore";
    static constexpr size_t kDefaultCacheSize = 1000;
    static constexpr std::string_view kPrivateKeyPrefix = "private_";

    /**
     * Opens the default two-tier storage: an LRU cache of
     * `config.cache_size` entries over LevelDB in `config.path`
     */
    static outcome::result<std::shared_ptr<KeyStore>> create(
        const Config &config);

    static outcome::result<std::shared_ptr<KeyStore>> create(
        const Config &config, std::shared_ptr<Secp256k1Provider> provider);

    KeyStore(std::shared_ptr<storage::BufferStorage> storage,
             std::shared_ptr<Secp256k1Provider> provider);

    /**
     * Generates a keypair and stores it under \param id, replacing the
     * previous one
     */
    outcome::result<Secp256k1Keypair> createKey(std::string_view id,
                                                KeyOptions options = {});

    /**
     * Stores an externally produced keypair under \param id
     */
    outcome::result<void> addKey(std::string_view id,
                                 const Secp256k1Keypair &keypair);

    /**
     * @return keypair stored under \param id or std::nullopt if there is
     * none. Storage faults are logged and reported as absence.
     */
    outcome::result<std::optional<Secp256k1Keypair>> getKey(
        std::string_view id) const;

    /**
     * @return true if a keypair is stored under \param id. Storage faults are
     * logged and reported as false.
     */
    outcome::result<bool> hasKey(std::string_view id) const;

    outcome::result<EncodedPublicKey> getPublicKey(
        const Secp256k1Keypair *keypair,
        PublicKeyFormat format = PublicKeyFormat::HEX) const;

    /**
     * Removes every stored keypair
     */
    outcome::result<void> clear();

    /**
     * Releases the storage, the instance is unusable afterwards
     */
    outcome::result<void> close();

   private:
    static common::Buffer recordKey(std::string_view id);

    std::shared_ptr<storage::BufferStorage> storage_;
    std::shared_ptr<Secp256k1Provider> provider_;
    log::Logger logger_;
  };

}  // namespace peerkeys::crypto

OUTCOME_HPP_DECLARE_ERROR(peerkeys::crypto, KeyStoreError);
