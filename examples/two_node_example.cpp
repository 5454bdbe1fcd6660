#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/data_store.hpp"
#include "cruxenclave/enclave.hpp"
#include "cruxenclave/logger.hpp"
#include "cruxenclave/service.hpp"
#include "cruxenclave/ws_client.hpp"
#include "cruxenclave/ws_peer_transport.hpp"
#include "cruxenclave/ws_server.hpp"

// Everything one node runs.
struct Node {
    Node(const std::string& url, std::vector<std::string> peers)
        : directory(url, std::move(peers)),
          enclave(store, CruxEnclave::KeyRing::generate(), directory, transport),
          service(enclave),
          server(service) {}

    void start(uint16_t port) {
        transport.start();
        server.run(port);
    }

    void stop() {
        server.stop();
        transport.stop();
    }

    CruxEnclave::MemoryDataStore store;
    CruxEnclave::PartyDirectory directory;
    CruxEnclave::net::WsPeerTransport transport;
    CruxEnclave::Enclave enclave;
    CruxEnclave::EnclaveService service;
    CruxEnclave::net::WsEnclaveServer server;
};

static bool connect_and_wait(CruxEnclave::net::WsEnclaveClient& client, const std::string& uri) {
    std::mutex mtx;
    std::condition_variable cv;
    bool ready = false;

    client.set_on_ready_callback([&]() {
        std::lock_guard<std::mutex> lock(mtx);
        ready = true;
        cv.notify_all();
    });
    client.connect(uri);

    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, std::chrono::seconds(5), [&] { return ready; });
}

int main() {
    // 1. Initialize logging and the crypto library
    CruxEnclave::init_logging("", CruxEnclave::severity_level::info);
    if (CruxEnclave::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    // 2. Start two nodes that know about each other
    const uint16_t port_a = 9101, port_b = 9102;
    const std::string url_a = "http://127.0.0.1:9101", url_b = "http://127.0.0.1:9102";
    Node a(url_a, {url_b});
    Node b(url_b, {url_a});
    a.start(port_a);
    b.start(port_b);
    std::cout << "[NODES] A on " << port_a << ", B on " << port_b << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // 3. One gossip round so A learns where B's key lives
    b.enclave.broadcast_directory();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    auto key_b = b.enclave.keys().default_identity().publicKey;
    std::cout << "[NODES] A resolves B's key to " << a.directory.resolve(key_b).value_or("<unknown>") << std::endl;

    // 4. A client of node A stores a payload for B
    CruxEnclave::net::WsEnclaveClient client_a;
    if (!connect_and_wait(client_a, CruxEnclave::net::to_ws_uri(url_a))) {
        std::cerr << "[CLIENT] Could not connect to node A" << std::endl;
        a.stop();
        b.stop();
        return 1;
    }

    std::string text = "Shipment 42 released";
    auto stored = client_a.store(CruxEnclave::byte_vector(text.begin(), text.end()), "",
                                 {CruxEnclave::encode_key(key_b)}).get();
    if (stored.status != CruxEnclave::Status::Ok) {
        std::cerr << "[CLIENT] Store failed: " << std::string(stored.result.begin(), stored.result.end()) << std::endl;
        a.stop();
        b.stop();
        return 1;
    }
    CruxEnclave::Digest digest{stored.result};
    std::cout << "[CLIENT] Stored on A, digest " << digest.to_hex().substr(0, 32) << "..." << std::endl;
    client_a.disconnect();

    // 5. A client of node B retrieves the pushed copy
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    CruxEnclave::net::WsEnclaveClient client_b;
    if (connect_and_wait(client_b, CruxEnclave::net::to_ws_uri(url_b))) {
        auto retrieved = client_b.retrieve(digest).get();
        if (retrieved.status == CruxEnclave::Status::Ok) {
            std::cout << "[CLIENT] B reads: " << std::string(retrieved.result.begin(), retrieved.result.end())
                      << std::endl;
        } else {
            std::cout << "[CLIENT] B could not read the payload, status "
                      << static_cast<int>(retrieved.status) << std::endl;
        }
        client_b.disconnect();
    }

    // 6. Shut down
    a.stop();
    b.stop();
    std::cout << "[NODES] Stopped." << std::endl;
    return 0;
}
