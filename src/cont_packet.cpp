#include "ctaphid/transport/cont_packet.hpp"
#include <iostream>
#include <algorithm>

namespace ctaphid {

Result<ContPacket> ContPacket::create(const ChannelId& cid, uint8_t seq,
                                      const uint8_t* payload, size_t len)
{
    // Bit 7 would make the frame read as an init frame
    if (seq > Protocol::MAX_SEQUENCE) {
        std::cerr << "Continuation sequence " << static_cast<int>(seq)
                  << " out of range 0-" << static_cast<int>(Protocol::MAX_SEQUENCE) << "\n";
        return Result<ContPacket>::failure(Error::INVALID_SEQUENCE);
    }

    if (payload == nullptr && len > 0) {
        std::cerr << "Continuation frame payload of " << len << " bytes has no data\n";
        return Result<ContPacket>::failure(Error::MALFORMED_FRAME);
    }

    if (len > Protocol::CONT_PAYLOAD_SIZE) {
        std::cerr << "Continuation frame payload of " << len << " bytes exceeds "
                  << Protocol::CONT_PAYLOAD_SIZE << "\n";
        return Result<ContPacket>::failure(Error::PAYLOAD_TOO_LARGE);
    }

    ContPacket packet;
    packet.cid_ = cid;
    packet.seq_ = seq;
    if (len > 0) {
        std::copy(payload, payload + len, packet.payload_.begin());
    }

    return Result<ContPacket>::success(packet);
}

Result<ContPacket> ContPacket::create(const ChannelId& cid, uint8_t seq,
                                      const std::vector<uint8_t>& payload)
{
    return create(cid, seq, payload.data(), payload.size());
}

Result<ContPacket> ContPacket::from_wire_format(const uint8_t* data, size_t len)
{
    auto result = report_from_frame(data, len);
    if (!result.ok()) {
        return Result<ContPacket>::failure(result.error());
    }

    auto& report = result.value();

    ContPacket packet;
    std::copy_n(report.begin() + Protocol::Offset::CID, Protocol::CID_SIZE, packet.cid_.begin());
    packet.seq_ = report[Protocol::Offset::SEQ];
    std::copy_n(report.begin() + Protocol::Offset::CONT_DATA, Protocol::CONT_PAYLOAD_SIZE,
                packet.payload_.begin());

    return Result<ContPacket>::success(packet);
}

Result<ContPacket> ContPacket::from_wire_format(const std::vector<uint8_t>& data)
{
    return from_wire_format(data.data(), data.size());
}

Report ContPacket::to_wire_format() const
{
    Report report = make_report();
    report[Protocol::Offset::SEQ] = seq_;
    std::copy(payload_.begin(), payload_.end(), report.begin() + Protocol::Offset::CONT_DATA);
    return report;
}

} // namespace ctaphid
