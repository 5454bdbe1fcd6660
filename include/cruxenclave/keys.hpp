#ifndef CRUXENCLAVE_KEYS_HPP
#define CRUXENCLAVE_KEYS_HPP

#include <vector>
#include <cstdint>
#include <string>

namespace CruxEnclave {

    // Size in bytes of both halves of a box key pair (X25519).
    constexpr size_t KEY_BYTES = 32;

    // A generic structure for a public key.
    struct PublicKey {
        std::vector<uint8_t> data;

        bool operator==(const PublicKey& other) const { return data == other.data; }
        bool operator!=(const PublicKey& other) const { return data != other.data; }
    };

    // A generic structure for a private key.
    struct PrivateKey {
        std::vector<uint8_t> data;
    };

    // A key pair consisting of a public and a private key.
    struct KeyPair {
        PublicKey publicKey;
        PrivateKey privateKey;
    };

    /**
     * @brief Renders a public key as its textual identifier (lower-case hex).
     */
    std::string encode_key(const PublicKey& key);

    /**
     * @brief Parses a 64-character hex identifier into a public key.
     * @throws CruxEnclave::MalformedKey if the string is not exactly one hex-encoded key.
     */
    PublicKey decode_public_key(const std::string& text);

    /**
     * @brief Parses a 64-character hex string into a private key.
     * @throws CruxEnclave::MalformedKey if the string is not exactly one hex-encoded key.
     */
    PrivateKey decode_private_key(const std::string& text);

} // namespace CruxEnclave

#endif // CRUXENCLAVE_KEYS_HPP
