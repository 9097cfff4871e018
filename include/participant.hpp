#ifndef LOBBYCHAT_PARTICIPANT_HPP
#define LOBBYCHAT_PARTICIPANT_HPP

#include <cstdint>
#include <string>

#include "packets.hpp"
#include "privileges.hpp"

using SessionId = std::int32_t;

// A connected client as seen by the channels it is a member of.
class Participant {
public:
    virtual ~Participant() = default;

    virtual SessionId id() const = 0;
    virtual const std::string &name() const = 0;
    virtual Privileges privileges() const = 0;

    // Queues a packet for delivery without blocking. Returns false when the
    // packet was not accepted (queue closed or full).
    virtual bool enqueue(PacketPtr packet) = 0;
};

#endif // LOBBYCHAT_PARTICIPANT_HPP
