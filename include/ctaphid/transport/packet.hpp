#pragma once

#include <array>
#include <vector>
#include <stdint.h>
#include <stddef.h>

#include "ctaphid/common/types.hpp"
#include "ctaphid/common/protocol.hpp"

namespace ctaphid {

using Report = std::array<uint8_t, Protocol::REPORT_SIZE>;
using ChannelId = std::array<uint8_t, Protocol::CID_SIZE>;

enum class FrameKind
{
    Init,
    Continuation
};

// Common surface of the init and continuation frames.
// Concrete frames also provide
//     static Result<Frame> from_wire_format(const uint8_t* data, size_t len);
// taking the 64-byte frame without the report-ID slot.
class Packet
{
public:
    virtual ~Packet() = default;

    // Full HID report, byte 0 always zero.
    virtual Report to_wire_format() const = 0;

    const ChannelId& cid() const { return cid_; }

protected:
    Packet() = default;
    Packet(const Packet&) = default;
    Packet& operator=(const Packet&) = default;

    // Report with the channel id written and everything else zero.
    Report make_report() const;

    // Places a 64-byte frame at offset 1 of a report.
    static Result<Report> report_from_frame(const uint8_t* data, size_t len);

    ChannelId cid_{};
};

// Receiver-side classification by bit 7 of the byte after the channel id.
Result<FrameKind> frame_kind(const uint8_t* data, size_t len);

const char* to_string(FrameKind kind);

} // namespace ctaphid
