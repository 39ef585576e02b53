#pragma once

#include <cstdint>
#include <optional>
#include <variant>

namespace cavro {

enum class Address : uint8_t
{
    ADDR_0 = 0x31,
    ADDR_1 = 0x32,
    ADDR_2 = 0x33,
    ADDR_3 = 0x34,
    ADDR_4 = 0x35,
    ADDR_5 = 0x36,
    ADDR_6 = 0x37,
    ADDR_7 = 0x38,
    ADDR_8 = 0x39,
    ADDR_9 = 0x3A,
    ADDR_A = 0x3B,
    ADDR_B = 0x3C,
    ADDR_C = 0x3D,
    ADDR_D = 0x3E,
    ADDR_E = 0x3F
};

enum class ValvePosition : uint8_t
{
    POS_1 = 1,
    POS_2 = 2,
    POS_3 = 3
};

// Full-stroke volume of the fitted syringe.
enum class SyringeSize : uint16_t
{
    S50 = 50,
    S100 = 100,
    S250 = 250,
    S500 = 500,
    S1000 = 1000,
    S2500 = 2500,
    S5000 = 5000
};

inline char address_char(Address addr)
{
    return static_cast<char>(addr);
}

std::optional<Address> address_from_char(char c);

namespace cmd {
    struct QueryStatus {};
    struct InitializePump {};
    struct SetSpeed { uint16_t speed; };
    struct MoveAbsolute { uint16_t position; };
    struct SelectValve { ValvePosition position; };
    struct QueryValve {};
}

using Command = std::variant<
    cmd::QueryStatus,
    cmd::InitializePump,
    cmd::SetSpeed,
    cmd::MoveAbsolute,
    cmd::SelectValve,
    cmd::QueryValve>;

} // namespace cavro
