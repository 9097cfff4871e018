#ifndef LOBBYCHAT_COMMAND_HPP
#define LOBBYCHAT_COMMAND_HPP

#include <cstddef>
#include <optional>
#include <string>

// A client to server text frame:
//   JOIN <channel>
//   PART <channel>
//   MSG <channel> <text>
//   LIST
struct Command {
    enum class Kind { Join, Part, Message, List };

    Kind kind;
    std::string channel;
    std::string text;
};

// Returns nothing for unknown verbs and missing arguments.
std::optional<Command> parseCommand(const std::string &frame);

// Shortens `text` to at most `limit` bytes, cutting on a UTF-8 code point
// boundary and marking the cut. Text within the limit is returned as is.
std::string truncateMessage(std::string text, std::size_t limit);

#endif // LOBBYCHAT_COMMAND_HPP
