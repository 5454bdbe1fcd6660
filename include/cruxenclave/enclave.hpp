#ifndef CRUXENCLAVE_ENCLAVE_HPP
#define CRUXENCLAVE_ENCLAVE_HPP

#include "content_store.hpp"
#include "crypto.hpp"
#include "envelope.hpp"
#include "key_ring.hpp"
#include "party_directory.hpp"
#include "transport.hpp"

#include <string>
#include <vector>

namespace CruxEnclave {

    /**
     * @brief Encrypts, distributes, persists and decrypts payloads for this node.
     *
     * A store seals the message once under a fresh master key, sends each reachable
     * recipient a copy holding only that recipient's box, and persists a copy holding
     * only the sender's self-box. Failures that concern a single recipient are logged
     * and skipped; only an unknown sender aborts a store.
     */
    class Enclave {
    public:
        /**
         * @param db Backing byte store for encoded envelopes.
         * @param keys The node's identities.
         * @param directory The process-wide peer directory.
         * @param transport Push channel to other nodes.
         */
        Enclave(DataStore& db, KeyRing keys, PartyDirectory& directory, PeerTransport& transport);

        /**
         * @brief Encrypts a message for the given recipients and persists the sender's copy.
         * @param message The plaintext.
         * @param sender Hex public key of one of the node's identities; empty selects the default.
         * @param recipients Hex public keys of the recipients.
         * @return The digest of the cipher text.
         * @throws CruxEnclave::UnknownSender if the sender is not a local identity.
         */
        Digest store(const byte_vector& message, const std::string& sender,
                     const std::vector<std::string>& recipients);

        /**
         * @brief Persists an envelope built elsewhere, usually one pushed by a peer.
         * @throws CruxEnclave::CodecError if the bytes are not an envelope.
         */
        Digest store_raw(const byte_vector& encoded_envelope);

        /**
         * @brief Decrypts a stored payload.
         * @throws CruxEnclave::NotFound if the digest is unknown.
         * @throws CruxEnclave::UnsealError if this node cannot open the stored copy.
         */
        byte_vector retrieve(const Digest& digest) const;

        /**
         * @throws CruxEnclave::NotFound if the digest is unknown.
         */
        void remove(const Digest& digest);

        /**
         * @brief Merges an encoded directory snapshot. Bad input is logged and dropped, never thrown.
         */
        void merge_directory(const byte_vector& encoded_party_info);

        /**
         * @brief Pushes this node's directory advertisement to every known party.
         */
        void broadcast_directory();

        const KeyRing& keys() const { return keys_; }
        PartyDirectory& directory() { return directory_; }

    private:
        struct SenderIdentity {
            PublicKey public_key;
            const PrivateKey& private_key;  // Owned by keys_
        };

        SenderIdentity resolve_sender(const std::string& sender) const;
        void distribute(const EncryptedPayload& base, const MasterKey& master_key,
                        const SenderIdentity& sender, const std::vector<std::string>& recipients);
        Digest persist(const EncryptedPayload& envelope, const byte_vector& encoded);

        ContentStore content_;
        KeyRing keys_;
        PartyDirectory& directory_;
        PeerTransport& transport_;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_ENCLAVE_HPP
