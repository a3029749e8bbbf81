#pragma once

#include <array>
#include <vector>
#include <stdint.h>

#include "ctaphid/transport/packet.hpp"
#include "ctaphid/common/command.hpp"

namespace ctaphid {

class InitPacket : public Packet
{
public:
    using Payload = std::array<uint8_t, Protocol::INIT_PAYLOAD_SIZE>;

    // size is the BCNT of the whole message, not the length of this chunk.
    static Result<InitPacket> create(const ChannelId& cid, CommandCode cmd, uint16_t size,
                                     const uint8_t* payload, size_t len);
    static Result<InitPacket> create(const ChannelId& cid, CommandCode cmd, uint16_t size,
                                     const std::vector<uint8_t>& payload);

    static Result<InitPacket> from_wire_format(const uint8_t* data, size_t len);
    static Result<InitPacket> from_wire_format(const std::vector<uint8_t>& data);

    Report to_wire_format() const override;

    CommandCode cmd() const { return cmd_; }
    uint8_t command_byte() const { return command_byte_; }
    uint16_t size() const { return size_; }

    // Always the whole 57-byte region; trim to size() at the reassembly layer.
    const Payload& payload() const { return payload_; }

private:
    InitPacket() = default;

    CommandCode cmd_ = CommandCode::Invalid;
    uint8_t command_byte_ = 0;
    uint16_t size_ = 0;
    Payload payload_{};
};

} // namespace ctaphid
