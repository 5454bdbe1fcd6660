#ifndef CRUXENCLAVE_CRYPTO_HPP
#define CRUXENCLAVE_CRYPTO_HPP

#include "keys.hpp"
#include "codec.hpp"

namespace CruxEnclave {

    // Nonce size shared by secretbox and box (XSalsa20).
    constexpr size_t NONCE_BYTES = 24;

    /**
     * @brief The per-payload symmetric key.
     * The bytes are wiped when the holder goes out of scope.
     */
    class MasterKey {
    public:
        MasterKey() = default;
        explicit MasterKey(byte_vector bytes) : data(std::move(bytes)) {}
        MasterKey(const MasterKey&) = default;
        MasterKey(MasterKey&&) = default;
        MasterKey& operator=(const MasterKey& other);
        MasterKey& operator=(MasterKey&& other) noexcept;
        ~MasterKey();

        byte_vector data;
    };

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a key pair for public-key authenticated encryption (X25519).
         * @return A KeyPair object.
         */
        static KeyPair generate_box_keypair();

        static MasterKey new_master_key();
        static byte_vector new_nonce();

        /**
         * @brief The result of sealing a payload body.
         */
        struct SealedPayload {
            byte_vector cipher_text;
            byte_vector nonce;
        };

        /**
         * @brief Encrypts a payload body using XSalsa20-Poly1305 (crypto_secretbox) under a fresh nonce.
         * @param plaintext The data to encrypt.
         * @param master_key The symmetric key for this payload.
         * @return The ciphertext (with authentication tag) and the nonce used.
         */
        static SealedPayload seal_payload(const byte_vector& plaintext, const MasterKey& master_key);

        /**
         * @brief Seals the master key for one recipient (crypto_box).
         *
         * The same recipient nonce is used for every recipient of one payload; each box
         * is keyed by a different sender/recipient shared secret.
         *
         * @param master_key The key to seal.
         * @param recipient_nonce The payload's shared recipient nonce.
         * @param recipient_pk The recipient's public key.
         * @param sender_sk The sender's private key.
         * @return The recipient box.
         */
        static byte_vector seal_master_key(const MasterKey& master_key,
                                           const byte_vector& recipient_nonce,
                                           const PublicKey& recipient_pk,
                                           const PrivateKey& sender_sk);

        /**
         * @brief Opens a recipient box.
         * @param box The sealed master key.
         * @param recipient_nonce The payload's shared recipient nonce.
         * @param peer_pk The public key of the other side of the box (the sender;
         *                for a self-box, the holder's own public key).
         * @param own_sk The private key of the holder.
         * @return The master key.
         * @throws CruxEnclave::UnsealError if authentication fails.
         */
        static MasterKey open_master_key(const byte_vector& box,
                                         const byte_vector& recipient_nonce,
                                         const PublicKey& peer_pk,
                                         const PrivateKey& own_sk);

        /**
         * @brief Decrypts a payload body.
         * @throws CruxEnclave::UnsealError if authentication fails.
         */
        static byte_vector open_payload(const byte_vector& cipher_text,
                                        const byte_vector& nonce,
                                        const MasterKey& master_key);
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_CRYPTO_HPP
