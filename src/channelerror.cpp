#include "channelerror.hpp"

#include <string>

namespace {

class ChannelCategory : public boost::system::error_category {
public:
    const char *name() const noexcept override { return "lobbychat.channel"; }

    std::string message(int ev) const override {
        switch (static_cast<ChannelError>(ev)) {
        case ChannelError::already_member:
            return "session is already a member of the channel";
        case ChannelError::not_member:
            return "session is not a member of the channel";
        case ChannelError::channel_destroyed:
            return "channel has been destroyed";
        case ChannelError::not_in_directory:
            return "channel is not registered in the directory";
        case ChannelError::channel_not_found:
            return "no such channel";
        case ChannelError::channel_exists:
            return "channel already exists";
        case ChannelError::read_denied:
            return "insufficient privileges to read the channel";
        case ChannelError::write_denied:
            return "insufficient privileges to write to the channel";
        }
        return "unknown channel error";
    }
};

} // namespace

const boost::system::error_category &channel_category() noexcept {
    static const ChannelCategory category;
    return category;
}

boost::system::error_code make_error_code(ChannelError e) noexcept {
    return {static_cast<int>(e), channel_category()};
}
