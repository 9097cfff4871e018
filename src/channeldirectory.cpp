#include "channeldirectory.hpp"

#include <algorithm>
#include <boost/format.hpp>
#include <iostream>
#include <mutex>

#include "channelerror.hpp"
#include "packets.hpp"

namespace {

constexpr int maxJoinAttempts = 3;

bool startsWith(const std::string &s, const char *prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

std::vector<ChannelOptions> defaultChannels() {
    return {
        {"#osu", "General discussion.", Privileges::Normal, Privileges::Normal, true, false},
        {"#announce", "Exemplary performance and public announcements.", Privileges::Normal, Privileges::Admin, true,
         false},
        {"#lobby", "Multiplayer lobby discussion room.", Privileges::Normal, Privileges::Normal, false, false},
        {"#help", "Help and support.", Privileges::Normal, Privileges::Normal, false, false},
        {"#staff", "Staff discussion.", Privileges::Staff, Privileges::Staff, false, false},
    };
}

ChannelDirectory::ChannelDirectory(const std::vector<ChannelOptions> &initial) {
    for (auto const &options : initial) {
        beast::error_code ec;
        createChannel(options, ec);
        if (ec) {
            std::cerr << boost::format("create %1%: %2%\n") % options.name % ec.message();
        }
    }
}

bool ChannelDirectory::isInstanceName(const std::string &internalName) {
    return startsWith(internalName, "#spec_") || startsWith(internalName, "#multi_");
}

std::shared_ptr<Channel> ChannelDirectory::createChannel(ChannelOptions options, beast::error_code &ec) {
    std::unique_lock lock(mu);

    auto name = options.name;
    if (channels_.find(name) != channels_.cend()) {
        ec = ChannelError::channel_exists;
        return nullptr;
    }
    auto channel = std::make_shared<Channel>(std::move(options), this);
    channels_.emplace(std::move(name), channel);
    ec = {};
    return channel;
}

std::shared_ptr<Channel> ChannelDirectory::find(const std::string &internalName) const {
    std::shared_lock lock(mu);

    auto it = channels_.find(internalName);
    return it == channels_.cend() ? nullptr : it->second;
}

std::shared_ptr<Channel> ChannelDirectory::findOrCreateInstance(const std::string &internalName) {
    if (!isInstanceName(internalName)) {
        return nullptr;
    }

    {
        std::shared_lock lock(mu);
        auto it = channels_.find(internalName);
        if (it != channels_.cend()) {
            return it->second;
        }
    }

    std::unique_lock lock(mu);
    auto it = channels_.find(internalName);
    if (it == channels_.cend()) {
        ChannelOptions options;
        options.name = internalName;
        options.topic = startsWith(internalName, "#spec_") ? "Spectator chat." : "Multiplayer chat.";
        options.autoJoin = false;
        options.instance = true;
        it = channels_.emplace(internalName, std::make_shared<Channel>(std::move(options), this)).first;
    }
    return it->second;
}

std::shared_ptr<Channel> ChannelDirectory::join(const std::string &internalName,
                                                const std::shared_ptr<Participant> &participant,
                                                beast::error_code &ec) {
    for (int attempt = 0; attempt < maxJoinAttempts; ++attempt) {
        auto channel = isInstanceName(internalName) ? findOrCreateInstance(internalName) : find(internalName);
        if (channel == nullptr) {
            ec = ChannelError::channel_not_found;
            return nullptr;
        }
        ec = channel->join(participant);
        if (ec != make_error_code(ChannelError::channel_destroyed)) {
            return ec ? nullptr : channel;
        }
    }
    return nullptr;
}

beast::error_code ChannelDirectory::removeChannel(const Channel &channel) {
    std::unique_lock lock(mu);

    auto it = channels_.find(channel.internalName());
    if (it == channels_.end() || it->second.get() != &channel) {
        return ChannelError::not_in_directory;
    }
    channels_.erase(it);
    return {};
}

beast::error_code ChannelDirectory::destroyChannel(const std::string &internalName) {
    std::shared_ptr<Channel> channel;
    {
        std::unique_lock lock(mu);
        auto it = channels_.find(internalName);
        if (it == channels_.end()) {
            return ChannelError::channel_not_found;
        }
        channel = std::move(it->second);
        channels_.erase(it);
    }

    auto kick = packets::channelKick(channel->displayName());
    for (auto const &participant : channel->close()) {
        if (!participant->enqueue(kick)) {
            std::cerr << boost::format("%1% kick: dropped for session %2%\n") % *channel % participant->id();
        }
    }
    return {};
}

std::vector<std::shared_ptr<Channel>> ChannelDirectory::channels() const {
    std::vector<std::shared_ptr<Channel>> result;
    {
        std::shared_lock lock(mu);
        result.reserve(channels_.size());
        for (auto const &entry : channels_) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(),
              [](auto const &a, auto const &b) { return a->internalName() < b->internalName(); });
    return result;
}

std::vector<std::shared_ptr<Channel>> ChannelDirectory::autoJoinChannels() const {
    auto result = channels();
    result.erase(std::remove_if(result.begin(), result.end(), [](auto const &c) { return !c->autoJoin(); }),
                 result.end());
    return result;
}

std::size_t ChannelDirectory::size() const {
    std::shared_lock lock(mu);
    return channels_.size();
}
