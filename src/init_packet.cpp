#include "ctaphid/transport/init_packet.hpp"
#include "ctaphid/common/endian.hpp"
#include <iostream>
#include <algorithm>

namespace ctaphid {

Result<InitPacket> InitPacket::create(const ChannelId& cid, CommandCode cmd, uint16_t size,
                                      const uint8_t* payload, size_t len)
{
    if (!is_known_command(cmd)) {
        std::cerr << "Refusing init frame with unknown command 0x" << std::hex
                  << static_cast<int>(static_cast<uint8_t>(cmd)) << std::dec << "\n";
        return Result<InitPacket>::failure(Error::INVALID_COMMAND);
    }

    if (payload == nullptr && len > 0) {
        std::cerr << "Init frame payload of " << len << " bytes has no data\n";
        return Result<InitPacket>::failure(Error::MALFORMED_FRAME);
    }

    if (len > Protocol::INIT_PAYLOAD_SIZE) {
        std::cerr << "Init frame payload of " << len << " bytes exceeds "
                  << Protocol::INIT_PAYLOAD_SIZE << "\n";
        return Result<InitPacket>::failure(Error::PAYLOAD_TOO_LARGE);
    }

    InitPacket packet;
    packet.cid_ = cid;
    packet.cmd_ = cmd;
    packet.command_byte_ = ctaphid::to_wire_format(cmd);
    packet.size_ = size;
    if (len > 0) {
        std::copy(payload, payload + len, packet.payload_.begin());
    }

    return Result<InitPacket>::success(packet);
}

Result<InitPacket> InitPacket::create(const ChannelId& cid, CommandCode cmd, uint16_t size,
                                      const std::vector<uint8_t>& payload)
{
    return create(cid, cmd, size, payload.data(), payload.size());
}

Result<InitPacket> InitPacket::from_wire_format(const uint8_t* data, size_t len)
{
    auto result = report_from_frame(data, len);
    if (!result.ok()) {
        return Result<InitPacket>::failure(result.error());
    }

    auto& report = result.value();

    InitPacket packet;
    std::copy_n(report.begin() + Protocol::Offset::CID, Protocol::CID_SIZE, packet.cid_.begin());
    packet.command_byte_ = report[Protocol::Offset::CMD] & static_cast<uint8_t>(~Protocol::FRAME_INIT);
    packet.cmd_ = command_from_wire(packet.command_byte_);
    packet.size_ = read_be16(&report[Protocol::Offset::BCNT]);
    std::copy_n(report.begin() + Protocol::Offset::INIT_DATA, Protocol::INIT_PAYLOAD_SIZE,
                packet.payload_.begin());

    return Result<InitPacket>::success(packet);
}

Result<InitPacket> InitPacket::from_wire_format(const std::vector<uint8_t>& data)
{
    return from_wire_format(data.data(), data.size());
}

Report InitPacket::to_wire_format() const
{
    Report report = make_report();
    report[Protocol::Offset::CMD] = Protocol::FRAME_INIT | command_byte_;
    write_be16(&report[Protocol::Offset::BCNT], size_);
    std::copy(payload_.begin(), payload_.end(), report.begin() + Protocol::Offset::INIT_DATA);
    return report;
}

} // namespace ctaphid
