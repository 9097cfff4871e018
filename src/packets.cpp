#include "packets.hpp"

#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <limits>

namespace packets {

PacketWriter::PacketWriter(PacketId id) : buf(headerSize, 0) {
    auto const raw = boost::endian::native_to_little(static_cast<std::uint16_t>(id));
    std::memcpy(buf.data(), &raw, sizeof(raw));
}

template <typename T> void PacketWriter::writeLittle(T value) {
    auto const raw = boost::endian::native_to_little(value);
    auto const bytes = reinterpret_cast<const std::uint8_t *>(&raw);
    buf.insert(buf.end(), bytes, bytes + sizeof(raw));
}

void PacketWriter::writeUleb128(std::uint32_t value) {
    do {
        std::uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value != 0) {
            byte |= 0x80;
        }
        buf.push_back(byte);
    } while (value != 0);
}

PacketWriter &PacketWriter::writeI16(std::int16_t value) {
    writeLittle(value);
    return *this;
}

PacketWriter &PacketWriter::writeI32(std::int32_t value) {
    writeLittle(value);
    return *this;
}

PacketWriter &PacketWriter::writeString(const std::string &value) {
    if (value.empty()) {
        buf.push_back(0x00);
        return *this;
    }
    buf.push_back(0x0b);
    writeUleb128(static_cast<std::uint32_t>(value.size()));
    buf.insert(buf.end(), value.begin(), value.end());
    return *this;
}

PacketPtr PacketWriter::finish() {
    auto const length = boost::endian::native_to_little(static_cast<std::uint32_t>(buf.size() - headerSize));
    std::memcpy(buf.data() + 3, &length, sizeof(length));
    return std::make_shared<const Packet>(std::move(buf));
}

namespace {

// The client reads member counts as a signed 16-bit value.
std::int16_t clampCount(std::size_t count) {
    return static_cast<std::int16_t>(std::min<std::size_t>(count, std::numeric_limits<std::int16_t>::max()));
}

} // namespace

PacketPtr sendMessage(const std::string &sender, const std::string &text, const std::string &target,
                      std::int32_t senderId) {
    return PacketWriter(PacketId::SendMessage)
        .writeString(sender)
        .writeString(text)
        .writeString(target)
        .writeI32(senderId)
        .finish();
}

PacketPtr notification(const std::string &text) {
    return PacketWriter(PacketId::Notification).writeString(text).finish();
}

PacketPtr channelJoin(const std::string &name) {
    return PacketWriter(PacketId::ChannelJoinSuccess).writeString(name).finish();
}

PacketPtr channelInfo(const std::string &name, const std::string &topic, std::size_t memberCount) {
    return PacketWriter(PacketId::ChannelInfo)
        .writeString(name)
        .writeString(topic)
        .writeI16(clampCount(memberCount))
        .finish();
}

PacketPtr channelKick(const std::string &name) {
    return PacketWriter(PacketId::ChannelKick).writeString(name).finish();
}

PacketPtr channelAutoJoin(const std::string &name, const std::string &topic, std::size_t memberCount) {
    return PacketWriter(PacketId::ChannelAutoJoin)
        .writeString(name)
        .writeString(topic)
        .writeI16(clampCount(memberCount))
        .finish();
}

PacketPtr channelInfoEnd() { return PacketWriter(PacketId::ChannelInfoEnd).finish(); }

} // namespace packets
