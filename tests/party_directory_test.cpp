#include "cruxenclave/party_directory.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <thread>
#include <vector>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"

namespace {

const std::string SELF_URL = "http://node-a";

std::string new_key_id() {
    return CruxEnclave::encode_key(CruxEnclave::Crypto::generate_box_keypair().publicKey);
}

}  // namespace

TEST(PartyDirectoryTest, MergeAndResolve) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyDirectory directory(SELF_URL);
    std::string key = new_key_id();

    ASSERT_FALSE(directory.resolve(CruxEnclave::decode_public_key(key)).has_value());

    CruxEnclave::PartyInfo incoming;
    incoming.url = "http://node-b";
    incoming.recipients[key] = "http://node-b";
    incoming.parties = {"http://node-b", "http://node-c"};
    directory.merge(incoming);

    auto url = directory.resolve(CruxEnclave::decode_public_key(key));
    ASSERT_TRUE(url.has_value());
    ASSERT_EQ(*url, "http://node-b");

    auto parties = directory.parties();
    ASSERT_EQ(parties, (std::vector<std::string>{"http://node-b", "http://node-c"}));
}

TEST(PartyDirectoryTest, MergeIsIdempotent) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyInfo incoming;
    incoming.url = "http://node-b";
    incoming.recipients[new_key_id()] = "http://node-b";
    incoming.recipients[new_key_id()] = "http://node-c";
    incoming.parties = {"http://node-b", "http://node-c"};

    CruxEnclave::PartyDirectory once(SELF_URL);
    once.merge(incoming);

    CruxEnclave::PartyDirectory twice(SELF_URL);
    twice.merge(incoming);
    twice.merge(incoming);

    ASSERT_EQ(once.snapshot(), twice.snapshot());
}

TEST(PartyDirectoryTest, SelfPointingEntriesAreDropped) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyDirectory directory(SELF_URL);
    std::string key = new_key_id();

    CruxEnclave::PartyInfo first;
    first.url = "http://node-b";
    first.recipients[key] = "http://node-b";
    directory.merge(first);
    auto before = directory.snapshot();

    // A peer claims the key lives at our own URL
    CruxEnclave::PartyInfo spoof;
    spoof.url = "http://node-evil";
    spoof.recipients[key] = SELF_URL;
    spoof.recipients[new_key_id()] = SELF_URL;
    spoof.parties = {SELF_URL};
    directory.merge(spoof);

    ASSERT_EQ(directory.snapshot(), before);
    ASSERT_EQ(*directory.resolve(CruxEnclave::decode_public_key(key)), "http://node-b");
}

TEST(PartyDirectoryTest, LastWriterWins) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyDirectory directory(SELF_URL);
    std::string key = new_key_id();

    CruxEnclave::PartyInfo first;
    first.recipients[key] = "http://node-b";
    directory.merge(first);

    CruxEnclave::PartyInfo second;
    second.recipients[key] = "http://node-c";
    directory.merge(second);

    ASSERT_EQ(*directory.resolve(CruxEnclave::decode_public_key(key)), "http://node-c");
}

TEST(PartyDirectoryTest, MalformedKeysAreIgnored) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyDirectory directory(SELF_URL);
    std::string key = new_key_id();

    CruxEnclave::PartyInfo incoming;
    incoming.recipients["not-a-key"] = "http://node-b";
    incoming.recipients[key] = "http://node-b";
    directory.merge(incoming);

    ASSERT_EQ(directory.snapshot().recipients.size(), 1u);
}

TEST(PartyDirectoryTest, UpperCaseKeysAreCanonicalized) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    auto kp = CruxEnclave::Crypto::generate_box_keypair();
    std::string upper = CruxEnclave::encode_key(kp.publicKey);
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    CruxEnclave::PartyDirectory directory(SELF_URL);
    CruxEnclave::PartyInfo incoming;
    incoming.recipients[upper] = "http://node-b";
    directory.merge(incoming);

    ASSERT_EQ(*directory.resolve(kp.publicKey), "http://node-b");
}

TEST(PartyDirectoryTest, SeedPartiesExcludeSelf) {
    CruxEnclave::PartyDirectory directory(SELF_URL, {"http://node-b", SELF_URL});
    ASSERT_EQ(directory.parties(), (std::vector<std::string>{"http://node-b"}));
    ASSERT_EQ(directory.self_url(), SELF_URL);
}

TEST(PartyDirectoryTest, AdvertisementAddsOwnKeysWithoutStoringThem) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyDirectory directory(SELF_URL, {"http://node-b"});
    auto own = CruxEnclave::Crypto::generate_box_keypair().publicKey;

    auto advertised = directory.advertisement({own});
    ASSERT_EQ(advertised.url, SELF_URL);
    ASSERT_EQ(advertised.recipients.at(CruxEnclave::encode_key(own)), SELF_URL);
    ASSERT_EQ(advertised.parties.count(SELF_URL), 1u);
    ASSERT_EQ(advertised.parties.count("http://node-b"), 1u);

    ASSERT_FALSE(directory.resolve(own).has_value());
}

TEST(PartyDirectoryTest, PartyInfoSerialization) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyInfo original;
    original.url = "http://node-b";
    original.recipients[new_key_id()] = "http://node-b";
    original.recipients[new_key_id()] = "http://node-c";
    original.parties = {"http://node-b", "http://node-c"};

    auto deserialized = CruxEnclave::PartyInfo::deserialize(original.serialize());
    ASSERT_EQ(deserialized, original);
}

TEST(PartyDirectoryTest, PartyInfoDecodingDropsBadKeys) {
    CruxEnclave::ByteWriter writer;
    writer.add_bytes(std::string("http://node-b"));
    writer.add_u64(2);
    writer.add_bytes(CruxEnclave::byte_vector(5, 0x01));  // too short for a key
    writer.add_bytes(std::string("http://node-x"));
    writer.add_bytes(CruxEnclave::byte_vector(CruxEnclave::KEY_BYTES, 0x02));
    writer.add_bytes(std::string("http://node-b"));
    writer.add_u64(0);

    auto info = CruxEnclave::PartyInfo::deserialize(writer.take());
    ASSERT_EQ(info.recipients.size(), 1u);
    ASSERT_EQ(info.recipients.begin()->second, "http://node-b");

    ASSERT_THROW(CruxEnclave::PartyInfo::deserialize({0x00, 0x01}), CruxEnclave::CodecError);
}

TEST(PartyDirectoryTest, ConcurrentMergesAndReads) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);

    CruxEnclave::PartyDirectory directory(SELF_URL);
    std::vector<CruxEnclave::PublicKey> keys;
    for (int i = 0; i < 50; ++i) {
        keys.push_back(CruxEnclave::Crypto::generate_box_keypair().publicKey);
    }

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&directory, &keys, t]() {
            for (const auto& key : keys) {
                CruxEnclave::PartyInfo incoming;
                incoming.recipients[CruxEnclave::encode_key(key)] = "http://node-" + std::to_string(t);
                incoming.parties = {"http://node-" + std::to_string(t)};
                directory.merge(incoming);
                directory.resolve(key);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    ASSERT_EQ(directory.snapshot().recipients.size(), keys.size());
    ASSERT_EQ(directory.parties().size(), 4u);
    for (const auto& key : keys) {
        ASSERT_TRUE(directory.resolve(key).has_value());
    }
}
