#ifndef CRUXENCLAVE_TRANSPORT_HPP
#define CRUXENCLAVE_TRANSPORT_HPP

#include "envelope.hpp"

#include <string>

namespace CruxEnclave {

    /**
     * @brief Delivers encrypted copies and directory snapshots to other nodes.
     *
     * Both calls are best effort: they must return without waiting for delivery,
     * and the caller never consults a result.
     */
    class PeerTransport {
    public:
        virtual ~PeerTransport() = default;

        virtual void push(const EncryptedPayload& envelope, const std::string& url) = 0;

        virtual void push_party_info(const byte_vector& encoded_party_info, const std::string& url) = 0;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_TRANSPORT_HPP
