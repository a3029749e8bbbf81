#include "ctaphid/common/error_code.hpp"
#include <iostream>
#include <iomanip>

namespace ctaphid {

uint8_t to_wire_format(ErrorCode code)
{
    return static_cast<uint8_t>(code);
}

const char* description(ErrorCode code)
{
    switch (code) {
        case ErrorCode::InvalidCmd:   return "The command in the request is invalid";
        case ErrorCode::InvalidPar:   return "The parameter(s) in the request is invalid";
        case ErrorCode::InvalidLen:   return "The length field (BCNT) is invalid for the request";
        case ErrorCode::InvalidSeq:   return "The sequence does not match expected value";
        case ErrorCode::MsgTimeout:   return "The message has timed out";
        case ErrorCode::ChannelBusy:  return "The device is busy for the requesting channel";
        case ErrorCode::LockRequired: return "Command requires channel lock";
        case ErrorCode::NA:           return "Reserved error";
        case ErrorCode::Other:        return "Unspecified error";
    }
    return "Unknown error code";
}

Result<ErrorCode> error_code_from_wire(uint8_t byte)
{
    switch (byte) {
        case 0x01: return Result<ErrorCode>::success(ErrorCode::InvalidCmd);
        case 0x02: return Result<ErrorCode>::success(ErrorCode::InvalidPar);
        case 0x03: return Result<ErrorCode>::success(ErrorCode::InvalidLen);
        case 0x04: return Result<ErrorCode>::success(ErrorCode::InvalidSeq);
        case 0x05: return Result<ErrorCode>::success(ErrorCode::MsgTimeout);
        case 0x06: return Result<ErrorCode>::success(ErrorCode::ChannelBusy);
        case 0x0A: return Result<ErrorCode>::success(ErrorCode::LockRequired);
        case 0x0B: return Result<ErrorCode>::success(ErrorCode::NA);
        case 0x7F: return Result<ErrorCode>::success(ErrorCode::Other);
        default:
            break;
    }

    std::cerr << "Unknown CTAPHID error code 0x" << std::hex << std::setw(2)
              << std::setfill('0') << static_cast<int>(byte) << std::dec << "\n";
    return Result<ErrorCode>::failure(Error::UNKNOWN_ERROR_CODE);
}

} // namespace ctaphid
