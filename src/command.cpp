#include "ctaphid/common/command.hpp"

namespace ctaphid {

bool is_known_command(CommandCode cmd)
{
    switch (cmd) {
        case CommandCode::Invalid:
        case CommandCode::Ping:
        case CommandCode::Msg:
        case CommandCode::Lock:
        case CommandCode::Init:
        case CommandCode::Wink:
        case CommandCode::Cbor:
        case CommandCode::Cancel:
        case CommandCode::Keepalive:
        case CommandCode::Error:
            return true;
    }
    return false;
}

uint8_t to_wire_format(CommandCode cmd)
{
    return static_cast<uint8_t>(cmd);
}

CommandCode command_from_wire(uint8_t byte)
{
    auto cmd = static_cast<CommandCode>(byte);
    return is_known_command(cmd) ? cmd : CommandCode::Invalid;
}

const char* to_string(CommandCode cmd)
{
    switch (cmd) {
        case CommandCode::Invalid:   return "INVALID";
        case CommandCode::Ping:      return "PING";
        case CommandCode::Msg:       return "MSG";
        case CommandCode::Lock:      return "LOCK";
        case CommandCode::Init:      return "INIT";
        case CommandCode::Wink:      return "WINK";
        case CommandCode::Cbor:      return "CBOR";
        case CommandCode::Cancel:    return "CANCEL";
        case CommandCode::Keepalive: return "KEEPALIVE";
        case CommandCode::Error:     return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace ctaphid
