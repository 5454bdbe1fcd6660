#include <iostream>
#include <string>
#include <vector>

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/data_store.hpp"
#include "cruxenclave/enclave.hpp"
#include "cruxenclave/logger.hpp"

// Delivers pushes straight into another in-process enclave.
class LoopbackTransport : public CruxEnclave::PeerTransport {
public:
    void connect(const std::string& url, CruxEnclave::Enclave* enclave) { url_ = url; target_ = enclave; }

    void push(const CruxEnclave::EncryptedPayload& envelope, const std::string& url) override {
        std::cout << "[TRANSPORT] Pushing " << envelope.cipher_text.size() << " byte payload to " << url << std::endl;
        if (target_ != nullptr && url == url_) {
            target_->store_raw(envelope.serialize());
        }
    }

    void push_party_info(const CruxEnclave::byte_vector& encoded, const std::string& url) override {
        std::cout << "[TRANSPORT] Pushing directory to " << url << std::endl;
        if (target_ != nullptr && url == url_) {
            target_->merge_directory(encoded);
        }
    }

private:
    std::string url_;
    CruxEnclave::Enclave* target_ = nullptr;
};

int main() {
    // 1. Initialize logging and the crypto library
    CruxEnclave::init_logging("", CruxEnclave::severity_level::warning);
    if (CruxEnclave::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }
    std::cout << "Crypto library initialized." << std::endl;

    // 2. Two nodes, each with its own store, identity and directory
    CruxEnclave::MemoryDataStore store_a, store_b;
    CruxEnclave::PartyDirectory directory_a("http://node-a", {"http://node-b"});
    CruxEnclave::PartyDirectory directory_b("http://node-b");
    LoopbackTransport to_b, to_a;

    CruxEnclave::Enclave node_a(store_a, CruxEnclave::KeyRing::generate(), directory_a, to_b);
    CruxEnclave::Enclave node_b(store_b, CruxEnclave::KeyRing::generate(), directory_b, to_a);
    to_b.connect("http://node-b", &node_b);
    to_a.connect("http://node-a", &node_a);

    std::string key_b = CruxEnclave::encode_key(node_b.keys().default_identity().publicKey);
    std::cout << "Node B identity: " << key_b << std::endl;

    // 3. Node B advertises itself to node A
    directory_b.merge(CruxEnclave::PartyInfo{"http://node-a", {}, {"http://node-a"}});
    node_b.broadcast_directory();
    std::cout << "Node A resolves B's key to: " << directory_a.resolve(node_b.keys().default_identity().publicKey).value_or("<unknown>")
              << std::endl;

    // 4. Node A stores a message for node B
    std::string message = "Quarterly settlement: 1,000 units to B";
    CruxEnclave::byte_vector plaintext(message.begin(), message.end());
    CruxEnclave::Digest digest = node_a.store(plaintext, "", {key_b});
    std::cout << "Stored on A, digest: " << digest.to_hex().substr(0, 32) << "..." << std::endl;

    // 5. Both nodes can open their own copy
    try {
        auto on_a = node_a.retrieve(digest);
        auto on_b = node_b.retrieve(digest);
        std::cout << "A reads: " << std::string(on_a.begin(), on_a.end()) << std::endl;
        std::cout << "B reads: " << std::string(on_b.begin(), on_b.end()) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Retrieve failed: " << e.what() << std::endl;
        return 1;
    }

    // 6. Delete on A leaves B's copy alone
    node_a.remove(digest);
    try {
        node_a.retrieve(digest);
    } catch (const CruxEnclave::NotFound&) {
        std::cout << "A no longer has the payload." << std::endl;
    }
    auto still_on_b = node_b.retrieve(digest);
    std::cout << "B still reads " << still_on_b.size() << " bytes." << std::endl;

    return 0;
}
