#include "cruxenclave/party_directory.hpp"

#include <mutex>

#include "cruxenclave/errors.hpp"

namespace CruxEnclave {

    PartyDirectory::PartyDirectory(std::string self_url, std::vector<std::string> seed_parties)
        : self_url_(std::move(self_url)) {
        for (auto& party : seed_parties) {
            if (party != self_url_) {
                parties_.insert(std::move(party));
            }
        }
    }

    void PartyDirectory::merge(const PartyInfo& incoming) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        for (const auto& [public_key, url] : incoming.recipients) {
            if (url == self_url_) {
                continue;
            }
            try {
                recipients_[encode_key(decode_public_key(public_key))] = url;
            } catch (const MalformedKey&) {
                continue;
            }
        }

        for (const auto& url : incoming.parties) {
            if (url != self_url_) {
                parties_.insert(url);
            }
        }
    }

    std::optional<std::string> PartyDirectory::resolve(const PublicKey& public_key) const {
        std::string key = encode_key(public_key);

        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = recipients_.find(key);
        if (it == recipients_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> PartyDirectory::parties() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::vector<std::string>(parties_.begin(), parties_.end());
    }

    PartyInfo PartyDirectory::snapshot() const {
        PartyInfo info;
        info.url = self_url_;

        std::shared_lock<std::shared_mutex> lock(mutex_);
        info.recipients = recipients_;
        info.parties = parties_;
        return info;
    }

    PartyInfo PartyDirectory::advertisement(const std::vector<PublicKey>& own_keys) const {
        PartyInfo info = snapshot();
        for (const auto& key : own_keys) {
            info.recipients[encode_key(key)] = self_url_;
        }
        info.parties.insert(self_url_);
        return info;
    }

} // namespace CruxEnclave
