#ifndef LOBBYCHAT_CHANNELERROR_HPP
#define LOBBYCHAT_CHANNELERROR_HPP

#include <boost/system/error_code.hpp>
#include <type_traits>

enum class ChannelError {
    // Join of a session that is already a member.
    already_member = 1,
    // Leave of a session that is not a member.
    not_member,
    // Operation on a channel that was torn down.
    channel_destroyed,
    // The registry has no record of the channel asking to be removed.
    not_in_directory,
    channel_not_found,
    channel_exists,
    read_denied,
    write_denied,
};

const boost::system::error_category &channel_category() noexcept;

boost::system::error_code make_error_code(ChannelError e) noexcept;

namespace boost::system {
template <> struct is_error_code_enum<ChannelError> : std::true_type {};
} // namespace boost::system

#endif // LOBBYCHAT_CHANNELERROR_HPP
