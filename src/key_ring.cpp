#include "cruxenclave/key_ring.hpp"

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"

namespace CruxEnclave {

    KeyRing::KeyRing(std::vector<KeyPair> key_pairs) : key_pairs_(std::move(key_pairs)) {
        if (key_pairs_.empty()) {
            throw InvalidArgument("A key ring needs at least one key pair.");
        }
        for (const auto& kp : key_pairs_) {
            if (kp.publicKey.data.size() != KEY_BYTES || kp.privateKey.data.size() != KEY_BYTES) {
                throw InvalidArgument("Invalid key size in key pair.");
            }
        }
    }

    KeyRing KeyRing::generate(size_t count) {
        std::vector<KeyPair> key_pairs;
        key_pairs.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            key_pairs.push_back(Crypto::generate_box_keypair());
        }
        return KeyRing(std::move(key_pairs));
    }

    const PrivateKey& KeyRing::resolve_private(const PublicKey& public_key) const {
        for (const auto& kp : key_pairs_) {
            if (kp.publicKey == public_key) {
                return kp.privateKey;
            }
        }
        throw KeyNotFound("Unable to find private key for public key " + encode_key(public_key));
    }

    bool KeyRing::contains(const PublicKey& public_key) const {
        for (const auto& kp : key_pairs_) {
            if (kp.publicKey == public_key) {
                return true;
            }
        }
        return false;
    }

    const KeyPair& KeyRing::default_identity() const {
        return key_pairs_.front();
    }

    std::vector<PublicKey> KeyRing::public_keys() const {
        std::vector<PublicKey> keys;
        keys.reserve(key_pairs_.size());
        for (const auto& kp : key_pairs_) {
            keys.push_back(kp.publicKey);
        }
        return keys;
    }

} // namespace CruxEnclave
