#ifndef LOBBYCHAT_PRIVILEGES_HPP
#define LOBBYCHAT_PRIVILEGES_HPP

#include <cstdint>

enum class Privileges : std::uint32_t {
    None = 0,
    Normal = 1u << 0,
    Verified = 1u << 1,
    Whitelisted = 1u << 2,
    Supporter = 1u << 4,
    Premium = 1u << 5,
    Alumni = 1u << 7,
    Tournament = 1u << 10,
    Nominator = 1u << 11,
    Mod = 1u << 12,
    Admin = 1u << 13,
    Dangerous = 1u << 14,

    Staff = Mod | Admin | Dangerous,
};

constexpr Privileges operator|(Privileges lhs, Privileges rhs) {
    return static_cast<Privileges>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr Privileges operator&(Privileges lhs, Privileges rhs) {
    return static_cast<Privileges>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

// Whether `held` passes a gate of `required`: any shared bit does. An empty
// mask lets everyone through.
constexpr bool hasAny(Privileges held, Privileges required) {
    return required == Privileges::None || (held & required) != Privileges::None;
}

#endif // LOBBYCHAT_PRIVILEGES_HPP
