#include "ctaphid/transport/packet.hpp"
#include <iostream>
#include <algorithm>

namespace ctaphid {

Report Packet::make_report() const
{
    Report report{};
    std::copy(cid_.begin(), cid_.end(), report.begin() + Protocol::Offset::CID);
    return report;
}

Result<Report> Packet::report_from_frame(const uint8_t* data, size_t len)
{
    if (data == nullptr || len != Protocol::FRAME_SIZE) {
        std::cerr << "Malformed CTAPHID frame: expected " << Protocol::FRAME_SIZE
                  << " bytes, got " << (data ? len : 0) << "\n";
        return Result<Report>::failure(Error::MALFORMED_FRAME);
    }

    Report report{};
    std::copy(data, data + len, report.begin() + 1);
    return Result<Report>::success(report);
}

Result<FrameKind> frame_kind(const uint8_t* data, size_t len)
{
    if (data == nullptr || len != Protocol::FRAME_SIZE) {
        return Result<FrameKind>::failure(Error::MALFORMED_FRAME);
    }

    // data has no report-ID slot
    uint8_t marker = data[Protocol::Offset::CMD - 1];
    if (marker & Protocol::FRAME_INIT) {
        return Result<FrameKind>::success(FrameKind::Init);
    }
    return Result<FrameKind>::success(FrameKind::Continuation);
}

const char* to_string(FrameKind kind)
{
    switch (kind) {
        case FrameKind::Init:         return "INIT";
        case FrameKind::Continuation: return "CONT";
    }
    return "UNKNOWN";
}

} // namespace ctaphid
