#ifndef LOBBYCHAT_PACKETS_HPP
#define LOBBYCHAT_PACKETS_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using Packet = std::vector<std::uint8_t>;
using PacketPtr = std::shared_ptr<const Packet>;

namespace packets {

// Server to client packet ids of the bancho protocol.
enum class PacketId : std::uint16_t {
    SendMessage = 7,
    Notification = 24,
    ChannelJoinSuccess = 64,
    ChannelInfo = 65,
    ChannelKick = 66,
    ChannelAutoJoin = 67,
    ChannelInfoEnd = 89,
};

// Header: u16 id, u8 padding, u32 body length, all little-endian.
constexpr std::size_t headerSize = 7;

// Builds one packet body field by field and frames it on finish().
class PacketWriter {
public:
    explicit PacketWriter(PacketId id);

    PacketWriter &writeI16(std::int16_t value);
    PacketWriter &writeI32(std::int32_t value);
    PacketWriter &writeString(const std::string &value);

    PacketPtr finish();

private:
    template <typename T> void writeLittle(T value);
    void writeUleb128(std::uint32_t value);

    Packet buf;
};

PacketPtr sendMessage(const std::string &sender, const std::string &text, const std::string &target,
                      std::int32_t senderId);
PacketPtr notification(const std::string &text);
PacketPtr channelJoin(const std::string &name);
PacketPtr channelInfo(const std::string &name, const std::string &topic, std::size_t memberCount);
PacketPtr channelKick(const std::string &name);
PacketPtr channelAutoJoin(const std::string &name, const std::string &topic, std::size_t memberCount);
PacketPtr channelInfoEnd();

} // namespace packets

#endif // LOBBYCHAT_PACKETS_HPP
