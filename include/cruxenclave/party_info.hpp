#ifndef CRUXENCLAVE_PARTY_INFO_HPP
#define CRUXENCLAVE_PARTY_INFO_HPP

#include "codec.hpp"

#include <map>
#include <set>
#include <string>

namespace CruxEnclave {

    /**
     * @brief A node's view of the network: which node URL serves each recipient key,
     *        and the set of known node URLs.
     *
     * Recipient keys are held in their textual (hex) form.
     */
    struct PartyInfo {
        std::string url;
        std::map<std::string, std::string> recipients;
        std::set<std::string> parties;

        byte_vector serialize() const;

        /**
         * @brief Decodes a directory snapshot. Recipient entries whose key is not a
         *        32-byte public key are dropped.
         * @throws CruxEnclave::CodecError on structurally invalid input.
         */
        static PartyInfo deserialize(const byte_vector& data);

        bool operator==(const PartyInfo& other) const {
            return url == other.url && recipients == other.recipients && parties == other.parties;
        }
    };

}  // namespace CruxEnclave

#endif  // CRUXENCLAVE_PARTY_INFO_HPP
