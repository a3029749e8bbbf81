#pragma once

#include <array>
#include <vector>
#include <stdint.h>

#include "ctaphid/transport/packet.hpp"

namespace ctaphid {

class ContPacket : public Packet
{
public:
    using Payload = std::array<uint8_t, Protocol::CONT_PAYLOAD_SIZE>;

    static Result<ContPacket> create(const ChannelId& cid, uint8_t seq,
                                     const uint8_t* payload, size_t len);
    static Result<ContPacket> create(const ChannelId& cid, uint8_t seq,
                                     const std::vector<uint8_t>& payload);

    // seq is taken as received, even with bit 7 set.
    static Result<ContPacket> from_wire_format(const uint8_t* data, size_t len);
    static Result<ContPacket> from_wire_format(const std::vector<uint8_t>& data);

    Report to_wire_format() const override;

    uint8_t seq() const { return seq_; }
    const Payload& payload() const { return payload_; }

private:
    ContPacket() = default;

    uint8_t seq_ = 0;
    Payload payload_{};
};

} // namespace ctaphid
