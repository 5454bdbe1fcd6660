#include "cruxenclave/party_info.hpp"

#include "cruxenclave/errors.hpp"
#include "cruxenclave/keys.hpp"

namespace CruxEnclave {

byte_vector PartyInfo::serialize() const {
    ByteWriter writer;
    writer.add_bytes(url);

    // Only well-formed keys go on the wire
    std::vector<std::pair<PublicKey, std::string>> entries;
    for (const auto& [key, recipient_url] : recipients) {
        try {
            entries.emplace_back(decode_public_key(key), recipient_url);
        } catch (const MalformedKey&) {
            continue;
        }
    }

    writer.add_u64(static_cast<uint64_t>(entries.size()));
    for (const auto& [key, recipient_url] : entries) {
        writer.add_bytes(key.data);
        writer.add_bytes(recipient_url);
    }

    writer.add_u64(static_cast<uint64_t>(parties.size()));
    for (const auto& party : parties) {
        writer.add_bytes(party);
    }
    return writer.take();
}

PartyInfo PartyInfo::deserialize(const byte_vector& data) {
    PartyInfo info;
    ByteReader reader(data);

    info.url = reader.read_string();

    uint64_t recipient_count = reader.read_count(2 * sizeof(uint64_t));
    for (uint64_t i = 0; i < recipient_count; ++i) {
        byte_vector key = reader.read_bytes();
        std::string recipient_url = reader.read_string();
        if (key.size() != KEY_BYTES) {
            continue;
        }
        info.recipients[to_hex(key)] = recipient_url;
    }

    uint64_t party_count = reader.read_count(sizeof(uint64_t));
    for (uint64_t i = 0; i < party_count; ++i) {
        info.parties.insert(reader.read_string());
    }

    if (reader.has_more()) throw CodecError("Invalid party info: trailing data.");

    return info;
}

}  // namespace CruxEnclave
