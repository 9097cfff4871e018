#include "command.hpp"

namespace {

// Splits off the next space separated word, skipping leading spaces.
std::string nextWord(const std::string &s, std::string::size_type &pos) {
    pos = s.find_first_not_of(' ', pos);
    if (pos == std::string::npos) {
        pos = s.size();
        return {};
    }
    auto end = s.find(' ', pos);
    if (end == std::string::npos) {
        end = s.size();
    }
    auto word = s.substr(pos, end - pos);
    pos = end;
    return word;
}

} // namespace

std::optional<Command> parseCommand(const std::string &frame) {
    auto line = frame;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    std::string::size_type pos = 0;
    auto const verb = nextWord(line, pos);

    if (verb == "LIST") {
        return Command{Command::Kind::List, {}, {}};
    }

    Command command;
    if (verb == "JOIN") {
        command.kind = Command::Kind::Join;
    } else if (verb == "PART") {
        command.kind = Command::Kind::Part;
    } else if (verb == "MSG") {
        command.kind = Command::Kind::Message;
    } else {
        return std::nullopt;
    }

    command.channel = nextWord(line, pos);
    if (command.channel.empty() || command.channel[0] != '#') {
        return std::nullopt;
    }

    if (command.kind == Command::Kind::Message) {
        if (pos < line.size()) {
            command.text = line.substr(pos + 1);
        }
        if (command.text.empty()) {
            return std::nullopt;
        }
    }
    return command;
}

std::string truncateMessage(std::string text, std::size_t limit) {
    static const std::string suffix = "... (truncated)";

    if (text.size() <= limit) {
        return text;
    }
    if (limit <= suffix.size()) {
        return suffix.substr(0, limit);
    }
    auto cut = limit - suffix.size();
    // Back off continuation bytes (10xxxxxx) so no sequence is split.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xc0) == 0x80) {
        --cut;
    }
    text.resize(cut);
    return text + suffix;
}
