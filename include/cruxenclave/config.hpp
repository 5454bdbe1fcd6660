#ifndef CRUXENCLAVE_CONFIG_HPP
#define CRUXENCLAVE_CONFIG_HPP

#include "keys.hpp"
#include "logger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace CruxEnclave {

    // Paths of one identity's key files. Each file holds a single hex-encoded key.
    struct KeyFiles {
        std::string public_path;
        std::string private_path;
    };

    struct NodeConfig {
        std::string url;                  // This node's URL as peers know it
        uint16_t port = 0;                // Websocket listen port
        std::string storage_dir;          // Empty keeps payloads in memory
        std::vector<KeyFiles> key_files;  // First entry is the default identity
        bool generate_keys = false;       // Create missing key files (or an in-memory identity)
        std::vector<std::string> peers;   // Seed party URLs
        std::string log_file;             // Empty logs to stderr
        severity_level log_level = severity_level::info;

        /**
         * @brief Parses command-line arguments (without the program name).
         * @throws CruxEnclave::ConfigError on unknown flags, missing values or missing required flags.
         */
        static NodeConfig from_args(const std::vector<std::string>& args);

        static std::string usage(const std::string& program_name);
    };

    /**
     * @brief Loads the configured identities, creating missing key files when
     *        generate_keys is set.
     * @throws CruxEnclave::ConfigError if a file is missing or does not hold a valid key.
     */
    std::vector<KeyPair> load_key_pairs(const NodeConfig& config);

    /**
     * @brief Writes a key pair as two hex files.
     * @throws CruxEnclave::ConfigError if either file cannot be written.
     */
    void write_key_pair(const KeyPair& key_pair, const KeyFiles& files);

} // namespace CruxEnclave

#endif // CRUXENCLAVE_CONFIG_HPP
