#pragma once
#include <stdint.h>
#include <stddef.h>

namespace cavro {

namespace Protocol
{
    // Timeouts (ms)
    constexpr int READ_TIMEOUT_MS = 100;
    constexpr int POLL_INTERVAL_MS = 500;

    // Request framing
    constexpr char FRAME_START = '/';
    constexpr char FRAME_END = '\r';
    constexpr char EXECUTE = 'R';

    // Reply framing: '/' '0' <status> <payload...> ETX CR LF
    constexpr uint8_t ETX = 0x03;
    constexpr uint8_t CR = 0x0D;
    constexpr uint8_t LF = 0x0A;
    constexpr const char* REPLY_TERMINATOR = "\x03\r\n";
    constexpr size_t STATUS_INDEX = 2;

    // Status byte
    namespace Status {
        constexpr uint8_t READY = 0x6;
        constexpr uint8_t BUSY = 0x4;
        constexpr uint8_t CODE_MASK = 0x0F;
    }

    // Device addresses occupy '1'..'?'
    constexpr uint8_t ADDRESS_FIRST = 0x31;
    constexpr uint8_t ADDRESS_LAST = 0x3F;

    // Limits
    constexpr uint16_t MAX_SPEED = 40;
    constexpr uint16_t MAX_POSITION = 3000;

    // Command mnemonics
    namespace Command {
        constexpr const char* QUERY_STATUS = "Q";
        constexpr const char* INITIALIZE = "Z0,0,0";
        constexpr char SET_SPEED = 'S';
        constexpr char ABSOLUTE_POSITION = 'A';
        constexpr char VALVE_INPUT = 'I';
        constexpr const char* QUERY_VALVE = "?6";
    }
}

} // namespace cavro
