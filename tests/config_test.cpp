#include "cruxenclave/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"
#include "test_helpers.hpp"

TEST(ConfigTest, ParsesFullCommandLine) {
    auto config = CruxEnclave::NodeConfig::from_args({"--url", "http://10.0.0.1:9000", "--port", "9000",
                                                      "--storage", "/var/lib/crux", "--keys", "a.pub:a.key",
                                                      "--keys", "b.pub:b.key", "--peer", "http://10.0.0.2:9000",
                                                      "--peer", "http://10.0.0.3:9000", "--log-file", "node.log",
                                                      "--log-level", "debug"});

    ASSERT_EQ(config.url, "http://10.0.0.1:9000");
    ASSERT_EQ(config.port, 9000);
    ASSERT_EQ(config.storage_dir, "/var/lib/crux");
    ASSERT_EQ(config.key_files.size(), 2u);
    ASSERT_EQ(config.key_files[0].public_path, "a.pub");
    ASSERT_EQ(config.key_files[0].private_path, "a.key");
    ASSERT_EQ(config.key_files[1].public_path, "b.pub");
    ASSERT_EQ(config.peers, (std::vector<std::string>{"http://10.0.0.2:9000", "http://10.0.0.3:9000"}));
    ASSERT_EQ(config.log_file, "node.log");
    ASSERT_EQ(config.log_level, CruxEnclave::severity_level::debug);
    ASSERT_FALSE(config.generate_keys);
}

TEST(ConfigTest, Defaults) {
    auto config = CruxEnclave::NodeConfig::from_args({"--port", "9000", "--url", "http://localhost:9000",
                                                      "--generate-keys"});
    ASSERT_TRUE(config.generate_keys);
    ASSERT_TRUE(config.storage_dir.empty());
    ASSERT_TRUE(config.key_files.empty());
    ASSERT_TRUE(config.peers.empty());
    ASSERT_TRUE(config.log_file.empty());
    ASSERT_EQ(config.log_level, CruxEnclave::severity_level::info);
}

TEST(ConfigTest, RejectsBadArguments) {
    using CruxEnclave::NodeConfig;
    const std::vector<std::string> base = {"--url", "http://localhost:9000", "--keys", "a.pub:a.key"};

    auto with = [&](std::vector<std::string> extra) {
        auto args = base;
        args.insert(args.end(), extra.begin(), extra.end());
        return args;
    };

    ASSERT_THROW(NodeConfig::from_args(base), CruxEnclave::ConfigError);  // no port
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "0"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "70000"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "90a"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "nine"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "9000", "--bogus", "x"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "9000", "--peer"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "9000", "--log-level", "loud"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "9000", "--keys", "nocolon"})), CruxEnclave::ConfigError);
    ASSERT_THROW(NodeConfig::from_args(with({"--port", "9000", "--keys", ":a.key"})), CruxEnclave::ConfigError);

    // No identity at all
    ASSERT_THROW(NodeConfig::from_args({"--url", "http://localhost:9000", "--port", "9000"}),
                 CruxEnclave::ConfigError);

    ASSERT_NO_THROW(NodeConfig::from_args(with({"--port", "9000"})));
}

TEST(ConfigTest, UsageMentionsRequiredFlags) {
    auto text = CruxEnclave::NodeConfig::usage("cruxenclave-node");
    ASSERT_NE(text.find("--url"), std::string::npos);
    ASSERT_NE(text.find("--port"), std::string::npos);
    ASSERT_NE(text.find("--keys"), std::string::npos);
}

TEST(KeyFilesTest, GenerateThenReload) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);
    test_helpers::TempDir dir;

    CruxEnclave::NodeConfig config;
    config.generate_keys = true;
    config.key_files.push_back({(dir.path() / "a.pub").string(), (dir.path() / "a.key").string()});
    config.key_files.push_back({(dir.path() / "b.pub").string(), (dir.path() / "b.key").string()});

    auto generated = CruxEnclave::load_key_pairs(config);
    ASSERT_EQ(generated.size(), 2u);
    ASSERT_TRUE(std::filesystem::exists(dir.path() / "a.key"));
    ASSERT_NE(generated[0].publicKey, generated[1].publicKey);

    // Second start reads the same identities back
    config.generate_keys = false;
    auto reloaded = CruxEnclave::load_key_pairs(config);
    ASSERT_EQ(reloaded.size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        ASSERT_EQ(reloaded[i].publicKey, generated[i].publicKey);
        ASSERT_EQ(reloaded[i].privateKey.data, generated[i].privateKey.data);
    }

    // Files hold the hex form of each key
    std::ifstream in(dir.path() / "a.pub");
    std::string text;
    in >> text;
    ASSERT_EQ(text, CruxEnclave::encode_key(generated[0].publicKey));
}

TEST(KeyFilesTest, InMemoryIdentity) {
    ASSERT_EQ(CruxEnclave::Crypto::init(), 0);
    CruxEnclave::NodeConfig config;
    config.generate_keys = true;

    auto pairs = CruxEnclave::load_key_pairs(config);
    ASSERT_EQ(pairs.size(), 1u);
    ASSERT_EQ(pairs[0].publicKey.data.size(), CruxEnclave::KEY_BYTES);
}

TEST(KeyFilesTest, MissingOrBrokenFiles) {
    test_helpers::TempDir dir;
    CruxEnclave::KeyFiles files{(dir.path() / "n.pub").string(), (dir.path() / "n.key").string()};

    CruxEnclave::NodeConfig config;
    config.key_files.push_back(files);
    ASSERT_THROW(CruxEnclave::load_key_pairs(config), CruxEnclave::ConfigError);

    std::ofstream(files.public_path) << "zz";
    std::ofstream(files.private_path) << std::string(64, '0');
    ASSERT_THROW(CruxEnclave::load_key_pairs(config), CruxEnclave::ConfigError);

    // Half a pair on disk is not regenerated
    std::filesystem::remove(files.public_path);
    config.generate_keys = true;
    ASSERT_THROW(CruxEnclave::load_key_pairs(config), CruxEnclave::ConfigError);
}
