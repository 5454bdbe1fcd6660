#include "cruxenclave/content_store.hpp"

#include <openssl/evp.h>

#include "cruxenclave/errors.hpp"

namespace CruxEnclave {

ContentStore::ContentStore(DataStore& db) : db_(db) {}

Digest ContentStore::digest_of(const byte_vector& cipher_text) {
    Digest digest;
    digest.data.resize(DIGEST_BYTES);
    unsigned int digest_len = 0;

    if (EVP_Digest(cipher_text.data(), cipher_text.size(), digest.data.data(), &digest_len,
                   EVP_sha3_512(), nullptr) != 1 ||
        digest_len != DIGEST_BYTES) {
        throw RuntimeError("Failed to compute SHA3-512 digest.");
    }
    return digest;
}

void ContentStore::put(const Digest& digest, const byte_vector& encoded_envelope) {
    db_.put(digest.data, encoded_envelope);
}

byte_vector ContentStore::get(const Digest& digest) const {
    try {
        return db_.get(digest.data);
    } catch (const NotFound&) {
        throw NotFound("No payload stored for digest " + digest.to_hex());
    }
}

void ContentStore::remove(const Digest& digest) {
    try {
        db_.remove(digest.data);
    } catch (const NotFound&) {
        throw NotFound("No payload stored for digest " + digest.to_hex());
    }
}

bool ContentStore::contains(const Digest& digest) const {
    return db_.contains(digest.data);
}

} // namespace CruxEnclave
