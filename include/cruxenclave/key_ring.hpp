#ifndef CRUXENCLAVE_KEY_RING_HPP
#define CRUXENCLAVE_KEY_RING_HPP

#include "keys.hpp"

#include <vector>

namespace CruxEnclave {

    /**
     * @brief The node's own identities.
     *
     * An ordered, non-empty list of key pairs. Index 0 is the default identity.
     * Immutable after construction, so it can be shared between threads without locking.
     */
    class KeyRing {
    public:
        /**
         * @throws CruxEnclave::InvalidArgument if the list is empty or a key has the wrong size.
         */
        explicit KeyRing(std::vector<KeyPair> key_pairs);

        /**
         * @brief Creates a ring of freshly generated key pairs.
         */
        static KeyRing generate(size_t count = 1);

        /**
         * @brief Finds the private half of one of the node's key pairs.
         * @throws CruxEnclave::KeyNotFound if no pair has this public key.
         */
        const PrivateKey& resolve_private(const PublicKey& public_key) const;

        bool contains(const PublicKey& public_key) const;

        const KeyPair& default_identity() const;

        std::vector<PublicKey> public_keys() const;

        size_t size() const { return key_pairs_.size(); }

    private:
        std::vector<KeyPair> key_pairs_;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_KEY_RING_HPP
