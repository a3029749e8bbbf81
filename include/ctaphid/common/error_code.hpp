#pragma once

#include <stdint.h>
#include "ctaphid/common/types.hpp"

namespace ctaphid {

// Error codes carried in the payload of a CommandCode::Error message.
enum class ErrorCode : uint8_t
{
    InvalidCmd   = 0x01,
    InvalidPar   = 0x02,
    InvalidLen   = 0x03,
    InvalidSeq   = 0x04,
    MsgTimeout   = 0x05,
    ChannelBusy  = 0x06,
    LockRequired = 0x0A,
    NA           = 0x0B,
    Other        = 0x7F
};

uint8_t to_wire_format(ErrorCode code);

const char* description(ErrorCode code);

// There is no catch-all variant: unknown bytes fail with UNKNOWN_ERROR_CODE.
Result<ErrorCode> error_code_from_wire(uint8_t byte);

} // namespace ctaphid
