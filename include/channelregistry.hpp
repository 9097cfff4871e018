#ifndef LOBBYCHAT_CHANNELREGISTRY_HPP
#define LOBBYCHAT_CHANNELREGISTRY_HPP

#include <boost/beast/core/error.hpp>

namespace beast = boost::beast;

class Channel;

class ChannelRegistry {
public:
    virtual ~ChannelRegistry() = default;

    // Called by an instance channel, with its own lock held, when its last
    // member leaves. Must not acquire any channel lock.
    virtual beast::error_code removeChannel(const Channel &channel) = 0;
};

#endif // LOBBYCHAT_CHANNELREGISTRY_HPP
