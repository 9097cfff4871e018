#ifndef LOBBYCHAT_CHANNELDIRECTORY_HPP
#define LOBBYCHAT_CHANNELDIRECTORY_HPP

#include <boost/beast/core/error.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "channel.hpp"
#include "channelregistry.hpp"
#include "participant.hpp"

// The channels shipped with the server.
std::vector<ChannelOptions> defaultChannels();

// Live channels by internal name.
//
// The directory lock is never held while a channel lock is acquired: channel
// operations run on copies taken out of the map. Instance channels remove
// themselves through removeChannel() with their own lock held.
class ChannelDirectory : public ChannelRegistry {
public:
    ChannelDirectory() = default;
    explicit ChannelDirectory(const std::vector<ChannelOptions> &initial);

    // Fails with channel_exists if the name is taken.
    std::shared_ptr<Channel> createChannel(ChannelOptions options, beast::error_code &ec);

    std::shared_ptr<Channel> find(const std::string &internalName) const;

    // Resolves an instance channel, creating it if it does not exist yet.
    // Returns null when `internalName` has no instance prefix.
    std::shared_ptr<Channel> findOrCreateInstance(const std::string &internalName);

    // Resolves `internalName` and joins it. A join rejected because the
    // channel was torn down in the meantime is retried against the channel
    // that now answers to the name.
    std::shared_ptr<Channel> join(const std::string &internalName, const std::shared_ptr<Participant> &participant,
                                  beast::error_code &ec);

    beast::error_code removeChannel(const Channel &channel) override;

    // Administrative removal. Remaining members get a kick packet.
    [[nodiscard]] beast::error_code destroyChannel(const std::string &internalName);

    std::vector<std::shared_ptr<Channel>> channels() const;
    std::vector<std::shared_ptr<Channel>> autoJoinChannels() const;
    std::size_t size() const;

    static bool isInstanceName(const std::string &internalName);

private:
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
};

#endif // LOBBYCHAT_CHANNELDIRECTORY_HPP
