#ifndef CRUXENCLAVE_CONTENT_STORE_HPP
#define CRUXENCLAVE_CONTENT_STORE_HPP

#include "codec.hpp"
#include "data_store.hpp"

#include <string>

namespace CruxEnclave {

    // SHA3-512 output size.
    constexpr size_t DIGEST_BYTES = 64;

    // The content hash of a payload's cipher text; the handle returned to callers.
    struct Digest {
        byte_vector data;

        std::string to_hex() const { return CruxEnclave::to_hex(data); }

        bool operator==(const Digest& other) const { return data == other.data; }
        bool operator!=(const Digest& other) const { return data != other.data; }
    };

    /**
     * @brief Content-addressed storage of encoded envelopes.
     */
    class ContentStore {
    public:
        explicit ContentStore(DataStore& db);

        /**
         * @brief SHA3-512 of the cipher text. Nonces and recipient boxes are not part of the
         *        digest, so every node holding a copy of one message agrees on its handle.
         * @throws CruxEnclave::RuntimeError if the hash backend fails.
         */
        static Digest digest_of(const byte_vector& cipher_text);

        // Rewriting the same digest with the same bytes is a no-op in effect.
        void put(const Digest& digest, const byte_vector& encoded_envelope);

        /**
         * @throws CruxEnclave::NotFound if nothing is stored under the digest.
         */
        byte_vector get(const Digest& digest) const;

        /**
         * @throws CruxEnclave::NotFound if nothing is stored under the digest.
         */
        void remove(const Digest& digest);

        bool contains(const Digest& digest) const;

    private:
        DataStore& db_;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_CONTENT_STORE_HPP
