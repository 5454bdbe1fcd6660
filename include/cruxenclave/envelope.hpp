#ifndef CRUXENCLAVE_ENVELOPE_HPP
#define CRUXENCLAVE_ENVELOPE_HPP

#include "codec.hpp"
#include "keys.hpp"

namespace CruxEnclave {

    /**
     * @brief The on-wire structure of an encrypted message.
     *
     * cipher_text is the payload sealed once under a master key. Each entry of
     * recipient_boxes is that master key sealed for one recipient under
     * recipient_nonce. Copies that leave the dispatcher carry exactly one box.
     */
    struct EncryptedPayload {
        PublicKey sender;
        byte_vector cipher_text;
        byte_vector nonce;
        std::vector<byte_vector> recipient_boxes;
        byte_vector recipient_nonce;

        /**
         * @brief Returns a copy of this envelope carrying only the given box.
         */
        EncryptedPayload with_recipient_box(byte_vector box) const;

        byte_vector serialize() const;

        /**
         * @throws CruxEnclave::CodecError on truncated input, trailing bytes,
         *         or a sender/nonce of the wrong size.
         */
        static EncryptedPayload deserialize(const byte_vector& data);

        bool operator==(const EncryptedPayload& other) const;
    };

}  // namespace CruxEnclave

#endif  // CRUXENCLAVE_ENVELOPE_HPP
