#include "cruxenclave/envelope.hpp"

#include "cruxenclave/crypto.hpp"
#include "cruxenclave/errors.hpp"

namespace CruxEnclave {

EncryptedPayload EncryptedPayload::with_recipient_box(byte_vector box) const {
    EncryptedPayload copy;
    copy.sender = sender;
    copy.cipher_text = cipher_text;
    copy.nonce = nonce;
    copy.recipient_nonce = recipient_nonce;
    copy.recipient_boxes.push_back(std::move(box));
    return copy;
}

byte_vector EncryptedPayload::serialize() const {
    ByteWriter writer;
    writer.add_bytes(sender.data);
    writer.add_bytes(cipher_text);
    writer.add_bytes(nonce);

    writer.add_u64(static_cast<uint64_t>(recipient_boxes.size()));
    for (const auto& box : recipient_boxes) {
        writer.add_bytes(box);
    }

    writer.add_bytes(recipient_nonce);
    return writer.take();
}

EncryptedPayload EncryptedPayload::deserialize(const byte_vector& data) {
    EncryptedPayload epl;
    ByteReader reader(data);

    epl.sender.data = reader.read_bytes();
    if (epl.sender.data.size() != KEY_BYTES) throw CodecError("Invalid envelope: sender key has wrong size.");

    epl.cipher_text = reader.read_bytes();

    epl.nonce = reader.read_bytes();
    if (epl.nonce.size() != NONCE_BYTES) throw CodecError("Invalid envelope: nonce has wrong size.");

    uint64_t box_count = reader.read_count(sizeof(uint64_t));
    epl.recipient_boxes.reserve(box_count);
    for (uint64_t i = 0; i < box_count; ++i) {
        epl.recipient_boxes.push_back(reader.read_bytes());
    }

    epl.recipient_nonce = reader.read_bytes();
    if (epl.recipient_nonce.size() != NONCE_BYTES) throw CodecError("Invalid envelope: recipient nonce has wrong size.");

    if (reader.has_more()) throw CodecError("Invalid envelope: trailing data.");

    return epl;
}

bool EncryptedPayload::operator==(const EncryptedPayload& other) const {
    return sender == other.sender && cipher_text == other.cipher_text && nonce == other.nonce &&
           recipient_boxes == other.recipient_boxes && recipient_nonce == other.recipient_nonce;
}

}  // namespace CruxEnclave
