#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cruxenclave/config.hpp"
#include "cruxenclave/crypto.hpp"
#include "cruxenclave/data_store.hpp"
#include "cruxenclave/enclave.hpp"
#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"
#include "cruxenclave/party_directory.hpp"
#include "cruxenclave/service.hpp"
#include "cruxenclave/ws_peer_transport.hpp"
#include "cruxenclave/ws_server.hpp"

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}

// Seconds between directory broadcasts to known parties.
constexpr int BROADCAST_INTERVAL_SECONDS = 30;

}  // namespace

int main(int argc, char* argv[]) {
    CruxEnclave::NodeConfig config;
    try {
        config = CruxEnclave::NodeConfig::from_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const CruxEnclave::ConfigError& e) {
        std::cerr << "Error: " << e.what() << '\n' << CruxEnclave::NodeConfig::usage(argv[0]);
        return 1;
    }

    try {
        CruxEnclave::init_logging(config.log_file, config.log_level);

        if (CruxEnclave::Crypto::init() != 0) {
            LOG_FATAL << "Failed to initialize crypto library";
            return 1;
        }

        CruxEnclave::KeyRing keys(CruxEnclave::load_key_pairs(config));
        LOG_INFO << "Loaded identities, count=" << keys.size()
                 << ", default=" << CruxEnclave::encode_key(keys.default_identity().publicKey);

        std::unique_ptr<CruxEnclave::DataStore> db;
        if (config.storage_dir.empty()) {
            db = std::make_unique<CruxEnclave::MemoryDataStore>();
        } else {
            db = std::make_unique<CruxEnclave::FileDataStore>(config.storage_dir);
        }

        CruxEnclave::PartyDirectory directory(config.url, config.peers);
        CruxEnclave::net::WsPeerTransport transport;
        transport.start();

        CruxEnclave::Enclave enclave(*db, std::move(keys), directory, transport);
        CruxEnclave::EnclaveService service(enclave);
        CruxEnclave::net::WsEnclaveServer server(service);
        server.run(config.port);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        LOG_INFO << "Node started, url=" << config.url << ", port=" << config.port;

        auto next_broadcast = std::chrono::steady_clock::now();
        while (g_running) {
            if (std::chrono::steady_clock::now() >= next_broadcast) {
                enclave.broadcast_directory();
                next_broadcast = std::chrono::steady_clock::now() + std::chrono::seconds(BROADCAST_INTERVAL_SECONDS);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO << "Shutting down";
        server.stop();
        transport.stop();
    } catch (const std::exception& e) {
        LOG_FATAL << "Node failed: " << e.what();
        return 1;
    }
    return 0;
}
