#include "cruxenclave/config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {

// --- Command line ---

std::string NodeConfig::usage(const std::string& program_name) {
    std::ostringstream out;
    out << "Usage: " << program_name << " --url <url> --port <port> [options]\n"
        << "Required arguments:\n"
        << "  --url <url>                 URL other nodes use to reach this node\n"
        << "  --port <port>               Websocket listen port\n"
        << "Options:\n"
        << "  --keys <public>:<private>   Key files of one identity (repeatable, first is default)\n"
        << "  --generate-keys             Create missing key files, or an in-memory identity\n"
        << "  --storage <dir>             Payload directory (default: in memory)\n"
        << "  --peer <url>                Known node URL (repeatable)\n"
        << "  --log-file <path>           Log file (default: stderr)\n"
        << "  --log-level <level>         trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " --url http://127.0.0.1:9000 --port 9000 --keys node.pub:node.key\n";
    return out.str();
}

static KeyFiles parse_key_files(const std::string& value) {
    size_t sep = value.find(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 == value.size()) {
        throw ConfigError("--keys expects <public-file>:<private-file>, got '" + value + "'");
    }
    return KeyFiles{value.substr(0, sep), value.substr(sep + 1)};
}

static uint16_t parse_port(const std::string& value) {
    int port = 0;
    try {
        size_t consumed = 0;
        port = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError("Invalid port number: " + value);
        }
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid port number: " + value);
    }
    if (port <= 0 || port > 65535) {
        throw ConfigError("Port must be between 1 and 65535, got " + value);
    }
    return static_cast<uint16_t>(port);
}

NodeConfig NodeConfig::from_args(const std::vector<std::string>& args) {
    NodeConfig config;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        if (flag == "--generate-keys") {
            config.generate_keys = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw ConfigError("Missing value for argument: " + flag);
        }
        const std::string& value = args[++i];

        if (flag == "--url") {
            config.url = value;
        } else if (flag == "--port") {
            config.port = parse_port(value);
        } else if (flag == "--storage") {
            config.storage_dir = value;
        } else if (flag == "--keys") {
            config.key_files.push_back(parse_key_files(value));
        } else if (flag == "--peer") {
            config.peers.push_back(value);
        } else if (flag == "--log-file") {
            config.log_file = value;
        } else if (flag == "--log-level") {
            try {
                config.log_level = parse_severity(value);
            } catch (const InvalidArgument& e) {
                throw ConfigError(e.what());
            }
        } else {
            throw ConfigError("Unknown argument: " + flag);
        }
    }

    if (config.url.empty() || config.port == 0) {
        throw ConfigError("Both --url and --port are required");
    }
    if (config.key_files.empty() && !config.generate_keys) {
        throw ConfigError("At least one --keys pair (or --generate-keys) is required");
    }
    return config;
}

// --- Key files ---

static std::string read_key_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Unable to read key file " + path);
    }
    std::string text;
    in >> text;
    return text;
}

static void write_key_file(const std::string& path, const std::string& hex) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ConfigError("Unable to write key file " + path);
    }
    out << hex << '\n';
    if (!out) {
        throw ConfigError("Unable to write key file " + path);
    }
}

void write_key_pair(const KeyPair& key_pair, const KeyFiles& files) {
    write_key_file(files.public_path, to_hex(key_pair.publicKey.data));
    write_key_file(files.private_path, to_hex(key_pair.privateKey.data));
    std::error_code ec;
    std::filesystem::permissions(files.private_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        LOG_WARN << "Unable to restrict permissions of " << files.private_path << ": " << ec.message();
    }
}

std::vector<KeyPair> load_key_pairs(const NodeConfig& config) {
    std::vector<KeyPair> key_pairs;

    if (config.key_files.empty() && config.generate_keys) {
        key_pairs.push_back(Crypto::generate_box_keypair());
        return key_pairs;
    }

    for (const auto& files : config.key_files) {
        bool missing = !std::filesystem::exists(files.public_path) && !std::filesystem::exists(files.private_path);
        if (missing && config.generate_keys) {
            KeyPair kp = Crypto::generate_box_keypair();
            write_key_pair(kp, files);
            key_pairs.push_back(std::move(kp));
            continue;
        }

        KeyPair kp;
        try {
            kp.publicKey = decode_public_key(read_key_file(files.public_path));
            kp.privateKey = decode_private_key(read_key_file(files.private_path));
        } catch (const MalformedKey& e) {
            throw ConfigError("Invalid key in " + files.public_path + " / " + files.private_path + ": " + e.what());
        }
        key_pairs.push_back(std::move(kp));
    }
    return key_pairs;
}

} // namespace CruxEnclave
