#include "cruxenclave/keys.hpp"

#include "cruxenclave/codec.hpp"
#include "cruxenclave/errors.hpp"

namespace CruxEnclave {

    static std::vector<uint8_t> decode_key_bytes(const std::string& text) {
        if (text.size() != KEY_BYTES * 2) {
            throw MalformedKey("Key must be " + std::to_string(KEY_BYTES * 2) + " hex characters, got " +
                               std::to_string(text.size()) + ".");
        }
        try {
            return from_hex(text);
        } catch (const CodecError& e) {
            throw MalformedKey(std::string("Key is not valid hex: ") + e.what());
        }
    }

    std::string encode_key(const PublicKey& key) {
        return to_hex(key.data);
    }

    PublicKey decode_public_key(const std::string& text) {
        PublicKey key;
        key.data = decode_key_bytes(text);
        return key;
    }

    PrivateKey decode_private_key(const std::string& text) {
        PrivateKey key;
        key.data = decode_key_bytes(text);
        return key;
    }

} // namespace CruxEnclave
