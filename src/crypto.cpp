#include "cruxenclave/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "cruxenclave/errors.hpp"

static_assert(crypto_box_PUBLICKEYBYTES == CruxEnclave::KEY_BYTES, "box public key size");
static_assert(crypto_box_SECRETKEYBYTES == CruxEnclave::KEY_BYTES, "box secret key size");
static_assert(crypto_box_NONCEBYTES == CruxEnclave::NONCE_BYTES, "box nonce size");
static_assert(crypto_secretbox_NONCEBYTES == CruxEnclave::NONCE_BYTES, "secretbox nonce size");

namespace CruxEnclave {

    static std::atomic<bool> g_sodium_initialized = false;

    static void wipe(byte_vector& bytes) {
        if (!bytes.empty()) {
            sodium_memzero(bytes.data(), bytes.size());
        }
    }

    MasterKey& MasterKey::operator=(const MasterKey& other) {
        if (this != &other) {
            wipe(data);
            data = other.data;
        }
        return *this;
    }

    MasterKey& MasterKey::operator=(MasterKey&& other) noexcept {
        if (this != &other) {
            wipe(data);
            data = std::move(other.data);
            other.data.clear();
        }
        return *this;
    }

    MasterKey::~MasterKey() {
        wipe(data);
    }

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_box_keypair() {
        KeyPair kp;
        kp.publicKey.data.resize(crypto_box_PUBLICKEYBYTES);
        kp.privateKey.data.resize(crypto_box_SECRETKEYBYTES);
        crypto_box_keypair(kp.publicKey.data.data(), kp.privateKey.data.data());
        return kp;
    }

    MasterKey Crypto::new_master_key() {
        MasterKey key;
        key.data.resize(crypto_secretbox_KEYBYTES);
        crypto_secretbox_keygen(key.data.data());
        return key;
    }

    byte_vector Crypto::new_nonce() {
        byte_vector nonce(NONCE_BYTES);
        randombytes_buf(nonce.data(), nonce.size());
        return nonce;
    }

    Crypto::SealedPayload Crypto::seal_payload(const byte_vector& plaintext, const MasterKey& master_key) {
        if (master_key.data.size() != crypto_secretbox_KEYBYTES) {
            throw InvalidArgument("Invalid master key size for sealing.");
        }

        SealedPayload sealed;
        sealed.nonce = new_nonce();
        sealed.cipher_text.resize(plaintext.size() + crypto_secretbox_MACBYTES);

        crypto_secretbox_easy(sealed.cipher_text.data(),
                              plaintext.data(),
                              plaintext.size(),
                              sealed.nonce.data(),
                              master_key.data.data());
        return sealed;
    }

    byte_vector Crypto::seal_master_key(const MasterKey& master_key,
                                        const byte_vector& recipient_nonce,
                                        const PublicKey& recipient_pk,
                                        const PrivateKey& sender_sk) {
        if (master_key.data.size() != crypto_secretbox_KEYBYTES ||
            recipient_nonce.size() != crypto_box_NONCEBYTES ||
            recipient_pk.data.size() != crypto_box_PUBLICKEYBYTES ||
            sender_sk.data.size() != crypto_box_SECRETKEYBYTES) {
            throw InvalidArgument("Invalid key or nonce size for sealing a master key.");
        }

        byte_vector box(master_key.data.size() + crypto_box_MACBYTES);
        if (crypto_box_easy(box.data(),
                            master_key.data.data(),
                            master_key.data.size(),
                            recipient_nonce.data(),
                            recipient_pk.data.data(),
                            sender_sk.data.data()) != 0) {
            throw RuntimeError("Failed to seal master key for recipient.");
        }
        return box;
    }

    MasterKey Crypto::open_master_key(const byte_vector& box,
                                      const byte_vector& recipient_nonce,
                                      const PublicKey& peer_pk,
                                      const PrivateKey& own_sk) {
        if (box.size() != crypto_secretbox_KEYBYTES + crypto_box_MACBYTES ||
            recipient_nonce.size() != crypto_box_NONCEBYTES ||
            peer_pk.data.size() != crypto_box_PUBLICKEYBYTES ||
            own_sk.data.size() != crypto_box_SECRETKEYBYTES) {
            throw UnsealError("Unable to open master key box: invalid sizes.");
        }

        MasterKey key;
        key.data.resize(crypto_secretbox_KEYBYTES);
        if (crypto_box_open_easy(key.data.data(),
                                 box.data(),
                                 box.size(),
                                 recipient_nonce.data(),
                                 peer_pk.data.data(),
                                 own_sk.data.data()) != 0) {
            throw UnsealError("Unable to open master key box.");
        }
        return key;
    }

    byte_vector Crypto::open_payload(const byte_vector& cipher_text,
                                     const byte_vector& nonce,
                                     const MasterKey& master_key) {
        if (cipher_text.size() < crypto_secretbox_MACBYTES ||
            nonce.size() != crypto_secretbox_NONCEBYTES ||
            master_key.data.size() != crypto_secretbox_KEYBYTES) {
            throw UnsealError("Unable to open payload box: invalid sizes.");
        }

        byte_vector plaintext(cipher_text.size() - crypto_secretbox_MACBYTES);
        if (crypto_secretbox_open_easy(plaintext.data(),
                                       cipher_text.data(),
                                       cipher_text.size(),
                                       nonce.data(),
                                       master_key.data.data()) != 0) {
            throw UnsealError("Unable to open payload box. Authentication tag may be invalid.");
        }
        return plaintext;
    }

}  // namespace CruxEnclave
