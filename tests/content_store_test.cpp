#include "cruxenclave/content_store.hpp"

#include <gtest/gtest.h>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/envelope.hpp"
#include "cruxenclave/errors.hpp"
#include "test_helpers.hpp"

using test_helpers::bytes;

TEST(ContentStoreTest, DigestIsSha3_512) {
    // FIPS 202 test vectors
    ASSERT_EQ(CruxEnclave::ContentStore::digest_of({}).to_hex(),
              "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
              "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");
    ASSERT_EQ(CruxEnclave::ContentStore::digest_of(bytes("abc")).to_hex(),
              "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
              "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
    ASSERT_EQ(CruxEnclave::ContentStore::digest_of(bytes("abc")).data.size(), CruxEnclave::DIGEST_BYTES);
}

TEST(ContentStoreTest, DigestCoversCipherTextOnly) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    auto sender = CruxEnclave::Crypto::generate_box_keypair();
    auto other = CruxEnclave::Crypto::generate_box_keypair();
    auto master_key = CruxEnclave::Crypto::new_master_key();
    auto sealed = CruxEnclave::Crypto::seal_payload(bytes("hello"), master_key);

    CruxEnclave::EncryptedPayload base;
    base.sender = sender.publicKey;
    base.cipher_text = sealed.cipher_text;
    base.nonce = sealed.nonce;
    base.recipient_nonce = CruxEnclave::Crypto::new_nonce();

    auto self_copy = base.with_recipient_box(
        CruxEnclave::Crypto::seal_master_key(master_key, base.recipient_nonce, sender.publicKey, sender.privateKey));
    auto remote_copy = base.with_recipient_box(
        CruxEnclave::Crypto::seal_master_key(master_key, base.recipient_nonce, other.publicKey, sender.privateKey));
    auto renonced = remote_copy;
    renonced.recipient_nonce = CruxEnclave::Crypto::new_nonce();

    // Different boxes and recipient nonces, same handle
    ASSERT_NE(self_copy.serialize(), remote_copy.serialize());
    auto digest = CruxEnclave::ContentStore::digest_of(self_copy.cipher_text);
    ASSERT_EQ(CruxEnclave::ContentStore::digest_of(remote_copy.cipher_text), digest);
    ASSERT_EQ(CruxEnclave::ContentStore::digest_of(renonced.cipher_text), digest);

    // The same envelope bytes always decode to the same digest
    auto encoded = self_copy.serialize();
    auto first = CruxEnclave::ContentStore::digest_of(CruxEnclave::EncryptedPayload::deserialize(encoded).cipher_text);
    auto second = CruxEnclave::ContentStore::digest_of(CruxEnclave::EncryptedPayload::deserialize(encoded).cipher_text);
    ASSERT_EQ(first, second);
}

TEST(ContentStoreTest, PutGetRemove) {
    CruxEnclave::MemoryDataStore db;
    CruxEnclave::ContentStore store(db);

    auto digest = CruxEnclave::ContentStore::digest_of(bytes("cipher"));
    ASSERT_FALSE(store.contains(digest));
    ASSERT_THROW(store.get(digest), CruxEnclave::NotFound);

    store.put(digest, bytes("encoded envelope"));
    ASSERT_TRUE(store.contains(digest));
    ASSERT_EQ(store.get(digest), bytes("encoded envelope"));

    // Keyed by the raw digest bytes
    ASSERT_EQ(db.get(digest.data), bytes("encoded envelope"));

    // Idempotent rewrite
    store.put(digest, bytes("encoded envelope"));
    ASSERT_EQ(db.size(), 1u);

    store.remove(digest);
    ASSERT_THROW(store.get(digest), CruxEnclave::NotFound);
    ASSERT_THROW(store.remove(digest), CruxEnclave::NotFound);
}
