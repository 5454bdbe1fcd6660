#ifndef CRUXENCLAVE_PARTY_DIRECTORY_HPP
#define CRUXENCLAVE_PARTY_DIRECTORY_HPP

#include "keys.hpp"
#include "party_info.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace CruxEnclave {

    /**
     * @brief Process-wide peer directory.
     *
     * Created once with the node's own URL. Updated only through merge(); reads and
     * merges are serialized by one reader/writer lock.
     *
     * Directory updates are not signed. Dropping entries that point at our own URL
     * stops a peer from claiming to be us, but it does not stop false mappings for
     * other keys.
     */
    class PartyDirectory {
    public:
        explicit PartyDirectory(std::string self_url, std::vector<std::string> seed_parties = {});

        const std::string& self_url() const { return self_url_; }

        /**
         * @brief Folds an incoming snapshot into the directory.
         *
         * Every recipient entry not pointing at self_url overwrites the local entry for
         * that key (last writer wins). Every party URL other than self_url is added.
         */
        void merge(const PartyInfo& incoming);

        // No address is a normal outcome: the recipient is simply not reachable yet.
        std::optional<std::string> resolve(const PublicKey& public_key) const;

        std::vector<std::string> parties() const;

        PartyInfo snapshot() const;

        /**
         * @brief The snapshot this node gossips: the directory plus its own keys mapped to
         *        self_url. Own keys are not stored in the local recipients map.
         */
        PartyInfo advertisement(const std::vector<PublicKey>& own_keys) const;

    private:
        const std::string self_url_;

        mutable std::shared_mutex mutex_;
        std::map<std::string, std::string> recipients_;
        std::set<std::string> parties_;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_PARTY_DIRECTORY_HPP
