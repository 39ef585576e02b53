#include "common/helpers.hpp"
#include <sstream>
#include <iomanip>

namespace cavro {

std::string bytesToHex(const std::vector<uint8_t>& data)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string to_string(Error error)
{
    switch (error) {
        case Error::TIMEOUT:          return "TIMEOUT";
        case Error::FRAMING_ERROR:    return "FRAMING_ERROR";
        case Error::INVALID_RESPONSE: return "INVALID_RESPONSE";
        case Error::PORT_ERROR:       return "PORT_ERROR";
        case Error::WRITE_ERROR:      return "WRITE_ERROR";
        case Error::NOT_CONNECTED:    return "NOT_CONNECTED";
        case Error::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
        case Error::DEVICE_ERROR:     return "DEVICE_ERROR";
        case Error::WAIT_TIMEOUT:     return "WAIT_TIMEOUT";
        case Error::CANCELLED:        return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string to_string(ErrorCode code)
{
    switch (code) {
        case ErrorCode::NO_ERROR:                 return "NoError";
        case ErrorCode::INITIALIZATION:           return "Initialization";
        case ErrorCode::INVALID_COMMAND:          return "InvalidCommand";
        case ErrorCode::INVALID_OPERAND:          return "InvalidOperand";
        case ErrorCode::INVALID_COMMAND_SEQUENCE: return "InvalidCommandSequence";
        case ErrorCode::UNUSED:                   return "Unused";
        case ErrorCode::EEPROM_FAILURE:           return "EEPROMFailure";
        case ErrorCode::DEVICE_NOT_INITIALIZED:   return "DeviceNotInitialized";
        case ErrorCode::PLUNGER_OVERLOAD:         return "PlungerOverload";
        case ErrorCode::VALVE_OVERLOAD:           return "ValveOverload";
        case ErrorCode::PLUNGER_MOVE_NOT_ALLOWED: return "PlungerMoveNotAllowed";
        case ErrorCode::COMMAND_OVERFLOW:         return "CommandOverflow";
    }
    return "Unknown";
}

} // namespace cavro
