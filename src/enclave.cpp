#include "cruxenclave/enclave.hpp"

#include <set>

#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {

Enclave::Enclave(DataStore& db, KeyRing keys, PartyDirectory& directory, PeerTransport& transport)
    : content_(db), keys_(std::move(keys)), directory_(directory), transport_(transport) {}

// --- Store ---

Enclave::SenderIdentity Enclave::resolve_sender(const std::string& sender) const {
    if (sender.empty()) {
        const KeyPair& identity = keys_.default_identity();
        return SenderIdentity{identity.publicKey, identity.privateKey};
    }

    PublicKey public_key;
    try {
        public_key = decode_public_key(sender);
    } catch (const MalformedKey& e) {
        LOG_ERROR << "Unable to load sender public key, senderPubKey=" << sender << ", error=" << e.what();
        throw UnknownSender("Unable to load sender public key: " + std::string(e.what()));
    }

    try {
        const PrivateKey& private_key = keys_.resolve_private(public_key);
        return SenderIdentity{public_key, private_key};
    } catch (const KeyNotFound& e) {
        LOG_ERROR << "Unable to locate private key for sender public key, senderPubKey=" << sender;
        throw UnknownSender(e.what());
    }
}

Digest Enclave::store(const byte_vector& message, const std::string& sender,
                      const std::vector<std::string>& recipients) {
    SenderIdentity identity = resolve_sender(sender);

    MasterKey master_key = Crypto::new_master_key();
    Crypto::SealedPayload sealed = Crypto::seal_payload(message, master_key);

    EncryptedPayload base;
    base.sender = identity.public_key;
    base.cipher_text = std::move(sealed.cipher_text);
    base.nonce = std::move(sealed.nonce);
    base.recipient_nonce = Crypto::new_nonce();

    distribute(base, master_key, identity, recipients);

    byte_vector self_box =
        Crypto::seal_master_key(master_key, base.recipient_nonce, identity.public_key, identity.private_key);
    EncryptedPayload self_copy = base.with_recipient_box(std::move(self_box));

    Digest digest = persist(self_copy, self_copy.serialize());
    LOG_DEBUG << "Stored payload, digest=" << digest.to_hex() << ", recipients=" << recipients.size();
    return digest;
}

void Enclave::distribute(const EncryptedPayload& base, const MasterKey& master_key,
                         const SenderIdentity& sender, const std::vector<std::string>& recipients) {
    std::set<std::vector<uint8_t>> handled;

    for (const auto& recipient : recipients) {
        PublicKey recipient_key;
        try {
            recipient_key = decode_public_key(recipient);
        } catch (const MalformedKey& e) {
            LOG_WARN << "Unable to load recipient, recipientKey=" << recipient << ", error=" << e.what();
            continue;
        }

        if (recipient_key == sender.public_key) {
            LOG_WARN << "Sender cannot be recipient, recipientKey=" << recipient;
            continue;
        }

        if (!handled.insert(recipient_key.data).second) {
            LOG_DEBUG << "Skipping duplicate recipient, recipientKey=" << recipient;
            continue;
        }

        byte_vector box =
            Crypto::seal_master_key(master_key, base.recipient_nonce, recipient_key, sender.private_key);

        std::optional<std::string> url = directory_.resolve(recipient_key);
        if (!url) {
            LOG_WARN << "Unable to resolve host, recipientKey=" << recipient;
            continue;
        }

        EncryptedPayload copy = base.with_recipient_box(std::move(box));

        try {
            transport_.push(copy, *url);
        } catch (const std::exception& e) {
            LOG_ERROR << "Push to peer failed, url=" << *url << ", recipientKey=" << recipient
                      << ", error=" << e.what();
        }
    }
}

Digest Enclave::persist(const EncryptedPayload& envelope, const byte_vector& encoded) {
    Digest digest = ContentStore::digest_of(envelope.cipher_text);
    content_.put(digest, encoded);
    return digest;
}

Digest Enclave::store_raw(const byte_vector& encoded_envelope) {
    EncryptedPayload envelope = EncryptedPayload::deserialize(encoded_envelope);
    Digest digest = persist(envelope, encoded_envelope);
    LOG_DEBUG << "Stored pushed payload, digest=" << digest.to_hex()
              << ", sender=" << encode_key(envelope.sender);
    return digest;
}

// --- Retrieve / Delete ---

byte_vector Enclave::retrieve(const Digest& digest) const {
    byte_vector encoded = content_.get(digest);

    EncryptedPayload envelope;
    try {
        envelope = EncryptedPayload::deserialize(encoded);
    } catch (const CodecError& e) {
        LOG_ERROR << "Stored payload is corrupt, digest=" << digest.to_hex() << ", error=" << e.what();
        throw UnsealError("Stored payload cannot be decoded: " + std::string(e.what()));
    }

    if (envelope.recipient_boxes.empty()) {
        throw UnsealError("Stored payload carries no recipient box.");
    }

    // A self-copy is opened with the sending identity's key, anything else with the default identity.
    const PrivateKey& own_key = keys_.contains(envelope.sender) ? keys_.resolve_private(envelope.sender)
                                                                : keys_.default_identity().privateKey;

    MasterKey master_key = Crypto::open_master_key(
        envelope.recipient_boxes.front(), envelope.recipient_nonce, envelope.sender, own_key);

    return Crypto::open_payload(envelope.cipher_text, envelope.nonce, master_key);
}

void Enclave::remove(const Digest& digest) {
    content_.remove(digest);
}

// --- Directory ---

void Enclave::merge_directory(const byte_vector& encoded_party_info) {
    try {
        PartyInfo incoming = PartyInfo::deserialize(encoded_party_info);
        directory_.merge(incoming);
        LOG_DEBUG << "Merged party info, from=" << incoming.url << ", recipients=" << incoming.recipients.size()
                  << ", parties=" << incoming.parties.size();
    } catch (const std::exception& e) {
        LOG_WARN << "Dropping party info update, error=" << e.what();
    }
}

void Enclave::broadcast_directory() {
    byte_vector encoded = directory_.advertisement(keys_.public_keys()).serialize();

    for (const auto& url : directory_.parties()) {
        try {
            transport_.push_party_info(encoded, url);
        } catch (const std::exception& e) {
            LOG_ERROR << "Party info push failed, url=" << url << ", error=" << e.what();
        }
    }
}

} // namespace CruxEnclave
