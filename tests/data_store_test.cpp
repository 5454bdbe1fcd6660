#include "cruxenclave/data_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"
#include "test_helpers.hpp"

using test_helpers::bytes;

namespace {

// Runs the DataStore contract against every implementation.
void check_contract(CruxEnclave::DataStore& db) {
    CruxEnclave::byte_vector key = {0xAB, 0xCD, 0xEF, 0x01, 0x23};

    ASSERT_FALSE(db.contains(key));
    ASSERT_THROW(db.get(key), CruxEnclave::NotFound);
    ASSERT_THROW(db.remove(key), CruxEnclave::NotFound);

    db.put(key, bytes("first"));
    ASSERT_TRUE(db.contains(key));
    ASSERT_EQ(db.get(key), bytes("first"));

    // Rewriting the same bytes is harmless
    db.put(key, bytes("first"));
    ASSERT_EQ(db.get(key), bytes("first"));

    db.put(key, bytes("second"));
    ASSERT_EQ(db.get(key), bytes("second"));

    db.remove(key);
    ASSERT_FALSE(db.contains(key));
    ASSERT_THROW(db.get(key), CruxEnclave::NotFound);
    ASSERT_THROW(db.remove(key), CruxEnclave::NotFound);
}

}  // namespace

TEST(DataStoreTest, MemoryStoreContract) {
    CruxEnclave::MemoryDataStore db;
    check_contract(db);
    ASSERT_EQ(db.size(), 0u);
}

TEST(DataStoreTest, FileStoreContract) {
    test_helpers::TempDir dir;
    CruxEnclave::FileDataStore db(dir.path() / "payloads");
    check_contract(db);
}

TEST(DataStoreTest, FileStoreLayoutAndPersistence) {
    test_helpers::TempDir dir;
    CruxEnclave::byte_vector key = {0x12, 0x34, 0x56, 0x78};

    {
        CruxEnclave::FileDataStore db(dir.path());
        db.put(key, bytes("persisted"));
    }

    ASSERT_TRUE(std::filesystem::is_regular_file(dir.path() / "12" / "34" / "5678"));

    // A new store over the same directory sees earlier writes
    CruxEnclave::FileDataStore reopened(dir.path());
    ASSERT_EQ(reopened.get(key), bytes("persisted"));
}

TEST(DataStoreTest, FileStoreBinaryValues) {
    test_helpers::TempDir dir;
    CruxEnclave::FileDataStore db(dir.path());

    CruxEnclave::byte_vector key(64, 0x7F);
    CruxEnclave::byte_vector value;
    for (int i = 0; i < 256; ++i) {
        value.push_back(static_cast<uint8_t>(i));
    }

    db.put(key, value);
    ASSERT_EQ(db.get(key), value);

    db.put(key, {});
    ASSERT_TRUE(db.get(key).empty());
}

TEST(DataStoreTest, MemoryStoreConcurrentWriters) {
    CruxEnclave::MemoryDataStore db;

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&db, t]() {
            for (int i = 0; i < 100; ++i) {
                CruxEnclave::byte_vector key = {static_cast<uint8_t>(t), static_cast<uint8_t>(i)};
                db.put(key, key);
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }

    ASSERT_EQ(db.size(), 400u);
}

TEST(DataStoreTest, FileStoreConcurrentWriters) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);
    test_helpers::TempDir dir;
    CruxEnclave::FileDataStore db(dir.path());

    // Every thread writes the same envelope under the same digest, as a store racing a push would
    CruxEnclave::byte_vector key(64, 0xAB);
    CruxEnclave::byte_vector value(64 * 1024);
    for (size_t i = 0; i < value.size(); ++i) {
        value[i] = static_cast<uint8_t>(i * 31);
    }

    std::atomic<int> failures{0};
    for (int round = 0; round < 50; ++round) {
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&]() {
                try {
                    db.put(key, value);
                } catch (const CruxEnclave::Exception&) {
                    ++failures;
                }
            });
        }
        for (auto& w : writers) {
            w.join();
        }
        ASSERT_EQ(db.get(key), value);
    }

    ASSERT_EQ(failures.load(), 0);

    // No temp files are left beside the value
    size_t files = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir.path())) {
        if (entry.is_regular_file()) {
            ++files;
        }
    }
    ASSERT_EQ(files, 1u);
}
