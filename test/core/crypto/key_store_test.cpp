/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_store/key_store.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "mock/core/storage/buffer_storage_mock.hpp"
#include "storage/composed/composed_storage.hpp"
#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/lru/lru_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using namespace peerkeys::crypto;
using peerkeys::common::Buffer;
using peerkeys::storage::BufferStorageMock;
using peerkeys::storage::ComposedStorage;
using peerkeys::storage::DatabaseError;
using peerkeys::storage::InMemoryStorage;
using peerkeys::storage::LruStorage;

using ::testing::_;
using ::testing::Return;

class KeyStoreTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    provider_ = std::make_shared<Secp256k1ProviderImpl>(
        std::make_shared<BoostRandomGenerator>());
    persistent_ = std::make_shared<InMemoryStorage>();
    key_store_ = std::make_shared<KeyStore>(
        std::make_shared<ComposedStorage>(std::make_shared<LruStorage>(10),
                                          persistent_),
        provider_);
  }

 protected:
  std::shared_ptr<Secp256k1ProviderImpl> provider_;
  std::shared_ptr<InMemoryStorage> persistent_;
  std::shared_ptr<KeyStore> key_store_;
};

/**
 * @given empty key store
 * @when create key "userA" and read it back
 * @then the same keypair is returned
 */
TEST_F(KeyStoreTest, CreateThenGet) {
  EXPECT_OUTCOME_TRUE(created, key_store_->createKey("userA"));
  EXPECT_OUTCOME_TRUE(loaded, key_store_->getKey("userA"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, created);
  EXPECT_OUTCOME_TRUE(has, key_store_->hasKey("userA"));
  EXPECT_TRUE(has);
}

/**
 * @given created key
 * @when read it twice, the second time from the cache tier
 * @then both reads give equal keypairs
 */
TEST_F(KeyStoreTest, GetKeyTwiceEqual) {
  EXPECT_OUTCOME_TRUE(created, key_store_->createKey("userA"));
  EXPECT_OUTCOME_TRUE(first, key_store_->getKey("userA"));
  EXPECT_OUTCOME_TRUE(second, key_store_->getKey("userA"));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(*second, created);
}

/**
 * @given created key
 * @when look at the persistent tier
 * @then only raw private key bytes are stored under "private_" + id
 */
TEST_F(KeyStoreTest, StoredRecordFormat) {
  EXPECT_OUTCOME_TRUE(created, key_store_->createKey("userA"));
  EXPECT_OUTCOME_TRUE(record, persistent_->get("private_userA"_buf));
  EXPECT_EQ(record, Buffer(created.secret_key.view()));
  EXPECT_EQ(persistent_->size(), 1);
}

/**
 * @given key store
 * @when read unknown id
 * @then absence is reported without error
 */
TEST_F(KeyStoreTest, UnknownId) {
  EXPECT_OUTCOME_TRUE(loaded, key_store_->getKey("nobody"));
  EXPECT_FALSE(loaded.has_value());
  EXPECT_OUTCOME_TRUE(has, key_store_->hasKey("nobody"));
  EXPECT_FALSE(has);
}

/**
 * @given key store
 * @when called with empty id
 * @then usage errors are returned
 */
TEST_F(KeyStoreTest, EmptyId) {
  EXPECT_EC(key_store_->createKey(""), KeyStoreError::CREATE_WITHOUT_ID);
  EXPECT_EC(key_store_->getKey(""), KeyStoreError::GET_WITHOUT_ID);
  EXPECT_EC(key_store_->hasKey(""), KeyStoreError::CHECK_WITHOUT_ID);
  EXPECT_OUTCOME_TRUE(keypair, provider_->generateKeypair());
  EXPECT_EC(key_store_->addKey("", keypair), KeyStoreError::ADD_WITHOUT_ID);
}

/**
 * @given existing key "userA"
 * @when create it again
 * @then the new keypair replaces the old one
 */
TEST_F(KeyStoreTest, CreateOverwrites) {
  EXPECT_OUTCOME_TRUE(first, key_store_->createKey("userA"));
  EXPECT_OUTCOME_TRUE(second, key_store_->createKey("userA"));
  EXPECT_NE(first, second);
  EXPECT_OUTCOME_TRUE(loaded, key_store_->getKey("userA"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, second);
}

/**
 * @given fixed private key passed as entropy
 * @when create key
 * @then keypair is derived from it
 */
TEST_F(KeyStoreTest, CreateFromEntropy) {
  auto secret = Secp256k1PrivateKey::fromHex(
                    "e28bb9c778a5d02fa9f1b0656d1722ac840b174931398e4f34b35ad079"
                    "4b6d0a")
                    .value();
  EXPECT_OUTCOME_TRUE(keypair,
                      key_store_->createKey("userA", KeyOptions{secret}));
  EXPECT_EQ(keypair.secret_key, secret);
  EXPECT_EQ(keypair.public_key.toHex(),
            "0328110881430e7cfc5d90d05c37affa8ef63a99461feaf72b562cad231822c6"
            "b2");

  EXPECT_EC(key_store_->createKey("userB", KeyOptions{Secp256k1PrivateKey{}}),
            Secp256k1ProviderError::INVALID_PRIVATE_KEY);
}

/**
 * @given externally generated keypair
 * @when add it under an id
 * @then it is returned by getKey
 */
TEST_F(KeyStoreTest, AddKey) {
  EXPECT_OUTCOME_TRUE(keypair, provider_->generateKeypair());
  EXPECT_OUTCOME_TRUE_1(key_store_->addKey("external", keypair));
  EXPECT_OUTCOME_TRUE(loaded, key_store_->getKey("external"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, keypair);
}

/**
 * @given keypair
 * @when get public key as hex and as bytes
 * @then both encode the same compressed point
 */
TEST_F(KeyStoreTest, PublicKeyFormats) {
  EXPECT_OUTCOME_TRUE(keypair, key_store_->createKey("userA"));

  EXPECT_OUTCOME_TRUE(hex, key_store_->getPublicKey(&keypair));
  EXPECT_OUTCOME_TRUE(
      raw, key_store_->getPublicKey(&keypair, PublicKeyFormat::RAW));
  ASSERT_TRUE(std::holds_alternative<std::string>(hex));
  ASSERT_TRUE(std::holds_alternative<Buffer>(raw));
  EXPECT_EQ(std::get<std::string>(hex), std::get<Buffer>(raw).toHex());
  EXPECT_EQ(std::get<Buffer>(raw).size(), 33);

  EXPECT_EC(key_store_->getPublicKey(nullptr), KeyStoreError::NO_KEYPAIR);
}

TEST(PublicKeyFormatTest, FromString) {
  EXPECT_OUTCOME_TRUE(hex, publicKeyFormatFromString("hex"));
  EXPECT_EQ(hex, PublicKeyFormat::HEX);
  EXPECT_OUTCOME_TRUE(raw, publicKeyFormatFromString("buffer"));
  EXPECT_EQ(raw, PublicKeyFormat::RAW);
  EXPECT_EC(publicKeyFormatFromString("base64"),
            KeyStoreError::UNSUPPORTED_FORMAT);
}

/**
 * @given key store with keys
 * @when clear it
 * @then no key is found any more
 */
TEST_F(KeyStoreTest, Clear) {
  EXPECT_OUTCOME_TRUE_1(key_store_->createKey("userA"));
  EXPECT_OUTCOME_TRUE_1(key_store_->createKey("userB"));
  EXPECT_OUTCOME_TRUE_1(key_store_->clear());
  EXPECT_OUTCOME_TRUE(has_a, key_store_->hasKey("userA"));
  EXPECT_FALSE(has_a);
  EXPECT_OUTCOME_TRUE(has_b, key_store_->hasKey("userB"));
  EXPECT_FALSE(has_b);
}

/**
 * @given record which is not a valid private key
 * @when get key
 * @then INVALID_STORED_KEY is returned
 */
TEST_F(KeyStoreTest, CorruptedRecord) {
  EXPECT_OUTCOME_TRUE_1(persistent_->put("private_short"_buf, "abc"_buf));
  EXPECT_EC(key_store_->getKey("short"), KeyStoreError::INVALID_STORED_KEY);

  EXPECT_OUTCOME_TRUE_1(
      persistent_->put("private_zero"_buf, Buffer(32, 0)));
  EXPECT_EC(key_store_->getKey("zero"), KeyStoreError::INVALID_STORED_KEY);
}

/**
 * @given empty record stored under an id
 * @when get and check the key
 * @then both report absence
 */
TEST_F(KeyStoreTest, EmptyRecordIsAbsent) {
  EXPECT_OUTCOME_TRUE_1(persistent_->put("private_empty"_buf, Buffer{}));
  EXPECT_OUTCOME_TRUE(loaded, key_store_->getKey("empty"));
  EXPECT_FALSE(loaded.has_value());
  EXPECT_OUTCOME_TRUE(has, key_store_->hasKey("empty"));
  EXPECT_FALSE(has);
}

/**
 * @given storage failing every read
 * @when get or check a key
 * @then the fault is reported as absence
 */
TEST_F(KeyStoreTest, StorageFaultDowngraded) {
  auto storage = std::make_shared<BufferStorageMock>();
  KeyStore key_store{storage, provider_};
  EXPECT_CALL(*storage, tryGet(_))
      .WillRepeatedly(Return(outcome::failure(DatabaseError::IO_ERROR)));

  EXPECT_OUTCOME_TRUE(loaded, key_store.getKey("userA"));
  EXPECT_FALSE(loaded.has_value());
  EXPECT_OUTCOME_TRUE(has, key_store.hasKey("userA"));
  EXPECT_FALSE(has);
}

/**
 * @given closed key store
 * @when create a key
 * @then STORAGE_GONE is returned
 */
TEST_F(KeyStoreTest, Close) {
  EXPECT_OUTCOME_TRUE_1(key_store_->close());
  EXPECT_EC(key_store_->createKey("userA"), DatabaseError::STORAGE_GONE);
}

struct KeyStoreLevelDBTest : public test::BaseFS_Test {
  KeyStoreLevelDBTest() : test::BaseFS_Test("/tmp/peerkeys_key_store_test") {}
};

/**
 * @given key store over LevelDB
 * @when a key is created, the store closed and opened again
 * @then the key is still there
 */
TEST_F(KeyStoreLevelDBTest, KeysSurviveReopen) {
  KeyStore::Config config{.path = base_path / "keys", .cache_size = 10};

  EXPECT_OUTCOME_TRUE(store, KeyStore::create(config));
  EXPECT_OUTCOME_TRUE(created, store->createKey("userA"));
  EXPECT_OUTCOME_TRUE_1(store->close());

  EXPECT_OUTCOME_TRUE(reopened, KeyStore::create(config));
  EXPECT_OUTCOME_TRUE(loaded, reopened->getKey("userA"));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, created);

  EXPECT_OUTCOME_TRUE_1(reopened->clear());
  EXPECT_OUTCOME_TRUE(has, reopened->hasKey("userA"));
  EXPECT_FALSE(has);
}
