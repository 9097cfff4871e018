#include "channel.hpp"

#include <algorithm>
#include <boost/format.hpp>
#include <iostream>
#include <mutex>
#include <utility>

#include "channelerror.hpp"
#include "channelregistry.hpp"

namespace {

struct Alias {
    const char *prefix;
    const char *displayName;
};

constexpr Alias instanceAliases[] = {
    {"#spec_", "#spectator"},
    {"#multi_", "#multiplayer"},
};

void fail(const Channel &channel, beast::error_code ec, char const *what) {
    std::cerr << boost::format("%1% %2%: %3%\n") % channel % what % ec.message();
}

} // namespace

Channel::Channel(ChannelOptions options, ChannelRegistry *registry)
    : realName(std::move(options.name)), read(options.read), write(options.write), autoJoin_(options.autoJoin),
      instance(options.instance), registry(registry), topic_(std::move(options.topic)) {}

std::string Channel::displayNameOf(const std::string &internalName) {
    for (auto const &alias : instanceAliases) {
        if (internalName.compare(0, std::char_traits<char>::length(alias.prefix), alias.prefix) == 0) {
            return alias.displayName;
        }
    }
    return internalName;
}

std::string Channel::topic() const {
    std::shared_lock lock(mu);
    return topic_;
}

void Channel::setTopic(std::string topic) {
    std::unique_lock lock(mu);
    topic_ = std::move(topic);
}

bool Channel::isDestroyed() const {
    std::shared_lock lock(mu);
    return destroyed;
}

Channel::Summary Channel::summary() const {
    std::shared_lock lock(mu);
    return {displayName(), topic_, members.size()};
}

std::size_t Channel::memberCount() const {
    std::shared_lock lock(mu);
    return members.size();
}

bool Channel::contains(SessionId id) const {
    std::shared_lock lock(mu);
    return index.find(id) != index.end();
}

beast::error_code Channel::join(const std::shared_ptr<Participant> &participant) {
    std::unique_lock lock(mu);

    if (destroyed) {
        return ChannelError::channel_destroyed;
    }
    auto const id = participant->id();
    if (index.find(id) != index.end()) {
        return ChannelError::already_member;
    }
    members.push_back({id, participant});
    index.emplace(id, std::prev(members.end()));
    return {};
}

beast::error_code Channel::leave(SessionId id) {
    // The registry may drop the last owning reference while we hold the lock.
    auto const self = weak_from_this().lock();
    std::unique_lock lock(mu);

    if (destroyed) {
        return ChannelError::channel_destroyed;
    }
    auto it = index.find(id);
    if (it == index.end()) {
        return ChannelError::not_member;
    }
    members.erase(it->second);
    index.erase(it);

    if (!instance || !members.empty()) {
        return {};
    }

    // Last member of an instance: the channel goes away together with the
    // removal, so a join waiting on the lock sees it destroyed.
    destroyed = true;
    if (registry == nullptr) {
        return {};
    }
    auto ec = registry->removeChannel(*this);
    if (ec) {
        fail(*this, ec, "remove");
    }
    return ec;
}

std::vector<std::shared_ptr<Participant>> Channel::close() {
    std::unique_lock lock(mu);

    std::vector<std::shared_ptr<Participant>> evicted;
    if (destroyed) {
        return evicted;
    }
    destroyed = true;
    for (auto &member : members) {
        if (auto participant = member.participant.lock()) {
            evicted.push_back(std::move(participant));
        }
    }
    members.clear();
    index.clear();
    return evicted;
}

std::size_t Channel::deliver(const std::vector<std::pair<SessionId, std::shared_ptr<Participant>>> &recipients,
                             const PacketPtr &packet) {
    std::size_t delivered = 0;
    for (auto const &recipient : recipients) {
        if (recipient.second->enqueue(packet)) {
            ++delivered;
        } else {
            std::cerr << boost::format("%1% enqueue: dropped for session %2%\n") % *this % recipient.first;
        }
    }
    return delivered;
}

std::size_t Channel::enqueueRaw(const PacketPtr &packet, const std::vector<SessionId> &immune, beast::error_code &ec) {
    std::vector<std::pair<SessionId, std::shared_ptr<Participant>>> recipients;
    {
        std::shared_lock lock(mu);

        if (destroyed) {
            ec = ChannelError::channel_destroyed;
            return 0;
        }
        recipients.reserve(members.size());
        for (auto const &member : members) {
            if (std::find(immune.begin(), immune.end(), member.id) != immune.end()) {
                continue;
            }
            // Expired members are sessions that are shutting down and about to leave.
            if (auto participant = member.participant.lock()) {
                recipients.emplace_back(member.id, std::move(participant));
            }
        }
    }

    ec = {};
    return deliver(recipients, packet);
}

std::size_t Channel::broadcast(const Participant &sender, const PacketPtr &packet, bool includeSender,
                               beast::error_code &ec) {
    if (includeSender) {
        return enqueueRaw(packet, {}, ec);
    }
    return enqueueRaw(packet, {sender.id()}, ec);
}

std::size_t Channel::selectiveSend(const Participant &, const PacketPtr &packet,
                                   const std::vector<std::shared_ptr<Participant>> &targets, beast::error_code &ec) {
    if (isDestroyed()) {
        ec = ChannelError::channel_destroyed;
        return 0;
    }

    std::vector<std::pair<SessionId, std::shared_ptr<Participant>>> recipients;
    recipients.reserve(targets.size());
    for (auto const &target : targets) {
        if (target != nullptr) {
            recipients.emplace_back(target->id(), target);
        }
    }

    ec = {};
    return deliver(recipients, packet);
}

std::size_t Channel::send(const Participant &sender, const std::string &text, bool toSelf, beast::error_code &ec) {
    auto packet = packets::sendMessage(sender.name(), text, displayName(), sender.id());
    return broadcast(sender, packet, toSelf, ec);
}

std::size_t Channel::sendSelective(const Participant &sender, const std::string &text,
                                   const std::vector<std::shared_ptr<Participant>> &targets, beast::error_code &ec) {
    auto packet = packets::sendMessage(sender.name(), text, displayName(), sender.id());
    return selectiveSend(sender, packet, targets, ec);
}

std::ostream &operator<<(std::ostream &os, const Channel &channel) {
    return os << '<' << channel.internalName() << '>';
}
