#ifndef LOBBYCHAT_CHANNEL_HPP
#define LOBBYCHAT_CHANNEL_HPP

#include <boost/beast/core/error.hpp>
#include <cstddef>
#include <iosfwd>
#include <list>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "packets.hpp"
#include "participant.hpp"
#include "privileges.hpp"

namespace beast = boost::beast;

class ChannelRegistry;

struct ChannelOptions {
    std::string name;
    std::string topic;
    Privileges read = Privileges::Normal;
    Privileges write = Privileges::Normal;
    bool autoJoin = true;
    bool instance = false;
};

// One chat scope: an ordered membership set and the fan-out over it.
//
// Read and write privileges are not enforced here; callers check canRead() /
// canWrite() before joining or sending.
//
// An instance channel removes itself from its registry when its last member
// leaves. Lock order is channel before registry: the registry is called with
// this channel's lock held and must never lock a channel itself.
class Channel : public std::enable_shared_from_this<Channel> {
public:
    struct Summary {
        std::string name;
        std::string topic;
        std::size_t memberCount;
    };

    // `registry` may be null for channels that are never registered.
    explicit Channel(ChannelOptions options, ChannelRegistry *registry = nullptr);

    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;

    const std::string &internalName() const { return realName; }

    // The name shown to clients. Instance channels of one kind share an alias.
    std::string displayName() const { return displayNameOf(realName); }
    static std::string displayNameOf(const std::string &internalName);

    std::string topic() const;
    void setTopic(std::string topic);

    bool canRead(Privileges held) const { return hasAny(held, read); }
    bool canWrite(Privileges held) const { return hasAny(held, write); }

    bool autoJoin() const { return autoJoin_; }
    bool isInstance() const { return instance; }
    bool isDestroyed() const;

    // memberCount is only valid at the moment of the call.
    Summary summary() const;
    std::size_t memberCount() const;

    bool contains(SessionId id) const;
    bool contains(const Participant &participant) const { return contains(participant.id()); }

    [[nodiscard]] beast::error_code join(const std::shared_ptr<Participant> &participant);
    [[nodiscard]] beast::error_code leave(SessionId id);
    [[nodiscard]] beast::error_code leave(const Participant &participant) { return leave(participant.id()); }

    // Administrative teardown. Returns the members that were still connected.
    std::vector<std::shared_ptr<Participant>> close();

    // Fan-out. Each returns the number of packets accepted by recipients; a
    // recipient refusing delivery is logged and skipped.
    std::size_t enqueueRaw(const PacketPtr &packet, const std::vector<SessionId> &immune, beast::error_code &ec);
    std::size_t broadcast(const Participant &sender, const PacketPtr &packet, bool includeSender,
                          beast::error_code &ec);
    std::size_t selectiveSend(const Participant &sender, const PacketPtr &packet,
                              const std::vector<std::shared_ptr<Participant>> &targets, beast::error_code &ec);

    // Encode `text` as a chat message from `sender` to this channel, then fan out.
    std::size_t send(const Participant &sender, const std::string &text, bool toSelf, beast::error_code &ec);
    std::size_t sendSelective(const Participant &sender, const std::string &text,
                              const std::vector<std::shared_ptr<Participant>> &targets, beast::error_code &ec);

private:
    struct Member {
        SessionId id;
        std::weak_ptr<Participant> participant;
    };
    using MemberIter = std::list<Member>::iterator;

    std::size_t deliver(const std::vector<std::pair<SessionId, std::shared_ptr<Participant>>> &recipients,
                        const PacketPtr &packet);

    const std::string realName;
    const Privileges read;
    const Privileges write;
    const bool autoJoin_;
    const bool instance;
    ChannelRegistry *const registry;

    mutable std::shared_mutex mu;
    std::string topic_;
    std::list<Member> members;
    std::unordered_map<SessionId, MemberIter> index;
    bool destroyed = false;
};

std::ostream &operator<<(std::ostream &os, const Channel &channel);

#endif // LOBBYCHAT_CHANNEL_HPP
