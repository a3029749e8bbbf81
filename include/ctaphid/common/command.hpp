#pragma once

#include <stdint.h>

namespace ctaphid {

// Values are the wire bytes, without the init-frame marker bit.
enum class CommandCode : uint8_t
{
    Invalid   = 0x00,
    Ping      = 0x01,
    Msg       = 0x03,
    Lock      = 0x04,
    Init      = 0x06,
    Wink      = 0x08,
    Cbor      = 0x10,
    Cancel    = 0x11,
    Keepalive = 0x3b,
    Error     = 0x3f
};

bool is_known_command(CommandCode cmd);

uint8_t to_wire_format(CommandCode cmd);

// Unknown bytes decode to CommandCode::Invalid.
CommandCode command_from_wire(uint8_t byte);

const char* to_string(CommandCode cmd);

} // namespace ctaphid
