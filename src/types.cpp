#include "ctaphid/common/types.hpp"

namespace ctaphid {

const char* to_string(Error error)
{
    switch (error) {
        case Error::MALFORMED_FRAME:    return "malformed frame";
        case Error::PAYLOAD_TOO_LARGE:  return "payload too large";
        case Error::INVALID_SEQUENCE:   return "invalid sequence number";
        case Error::INVALID_COMMAND:    return "invalid command";
        case Error::UNKNOWN_ERROR_CODE: return "unknown error code";
    }
    return "unknown";
}

} // namespace ctaphid
