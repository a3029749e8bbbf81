#include <gtest/gtest.h>
#include <vector>

#include "ctaphid/transport/init_packet.hpp"

using namespace ctaphid;

namespace {

const ChannelId kCid = {0x11, 0x22, 0x33, 0x44};

std::vector<uint8_t> frame_of(const Report& report)
{
    return std::vector<uint8_t>(report.begin() + 1, report.end());
}

} // anonymous namespace

TEST(InitPacketTest, PingLayout)
{
    auto r = InitPacket::create(kCid, CommandCode::Ping, 1, std::vector<uint8_t>{0xAA});
    ASSERT_TRUE(r.ok());

    Report report = r.value().to_wire_format();
    EXPECT_EQ(report[0], 0x00);
    EXPECT_EQ(report[1], 0x11);
    EXPECT_EQ(report[2], 0x22);
    EXPECT_EQ(report[3], 0x33);
    EXPECT_EQ(report[4], 0x44);
    EXPECT_EQ(report[5], 0x81);
    EXPECT_EQ(report[6], 0x00);
    EXPECT_EQ(report[7], 0x01);
    EXPECT_EQ(report[8], 0xAA);
    for (size_t i = 9; i < report.size(); ++i) {
        EXPECT_EQ(report[i], 0x00) << "byte " << i;
    }
}

TEST(InitPacketTest, SizeIsBigEndian)
{
    auto r = InitPacket::create(kCid, CommandCode::Cbor, 0x1234, nullptr, 0);
    ASSERT_TRUE(r.ok());

    Report report = r.value().to_wire_format();
    EXPECT_EQ(report[5], 0x90);
    EXPECT_EQ(report[6], 0x12);
    EXPECT_EQ(report[7], 0x34);
    EXPECT_EQ(r.value().size(), 0x1234);
}

TEST(InitPacketTest, FullPayloadHasNoPadding)
{
    std::vector<uint8_t> payload(Protocol::INIT_PAYLOAD_SIZE);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i + 1);
    }

    auto r = InitPacket::create(kCid, CommandCode::Msg, 0xFFFF, payload);
    ASSERT_TRUE(r.ok());

    Report report = r.value().to_wire_format();
    for (size_t i = 0; i < payload.size(); ++i) {
        EXPECT_EQ(report[8 + i], payload[i]);
    }
    EXPECT_EQ(report[64], Protocol::INIT_PAYLOAD_SIZE);
}

TEST(InitPacketTest, ShortPayloadIsZeroPadded)
{
    std::vector<uint8_t> payload(Protocol::INIT_PAYLOAD_SIZE - 1, 0xEE);

    auto r = InitPacket::create(kCid, CommandCode::Msg, 100, payload);
    ASSERT_TRUE(r.ok());

    Report report = r.value().to_wire_format();
    EXPECT_EQ(report[63], 0xEE);
    EXPECT_EQ(report[64], 0x00);
}

TEST(InitPacketTest, OversizedPayloadIsRejected)
{
    std::vector<uint8_t> payload(Protocol::INIT_PAYLOAD_SIZE + 1, 0x01);

    auto r = InitPacket::create(kCid, CommandCode::Msg, 58, payload);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::PAYLOAD_TOO_LARGE);
}

TEST(InitPacketTest, ForgedCommandIsRejected)
{
    auto r = InitPacket::create(kCid, static_cast<CommandCode>(0x7E), 0, nullptr, 0);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::INVALID_COMMAND);
}

TEST(InitPacketTest, EveryUndeclaredCommandByteIsRejected)
{
    for (int byte = 0; byte <= 0xFF; ++byte) {
        auto cmd = static_cast<CommandCode>(byte);
        if (is_known_command(cmd)) {
            continue;
        }
        auto r = InitPacket::create(kCid, cmd, 1, std::vector<uint8_t>{0xAA});
        ASSERT_FALSE(r.ok()) << "byte " << byte;
        EXPECT_EQ(r.error(), Error::INVALID_COMMAND);
    }
}

TEST(InitPacketTest, NullPayloadWithLengthIsRejected)
{
    auto r = InitPacket::create(kCid, CommandCode::Ping, 5, nullptr, 5);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::MALFORMED_FRAME);
}

TEST(InitPacketTest, EveryCommandSurvivesDecode)
{
    const CommandCode commands[] = {
        CommandCode::Invalid, CommandCode::Ping, CommandCode::Msg, CommandCode::Lock,
        CommandCode::Init, CommandCode::Wink, CommandCode::Cbor, CommandCode::Cancel,
        CommandCode::Keepalive, CommandCode::Error,
    };
    std::vector<uint8_t> payload = {0x01, 0x02, 0x03};

    for (CommandCode cmd : commands) {
        auto built = InitPacket::create(kCid, cmd, 0xBEEF, payload);
        ASSERT_TRUE(built.ok()) << to_string(cmd);

        Report report = built.value().to_wire_format();
        EXPECT_EQ(report[5], 0x80 | to_wire_format(cmd)) << to_string(cmd);

        auto frame = frame_of(report);
        auto kind = frame_kind(frame.data(), frame.size());
        ASSERT_TRUE(kind.ok());
        EXPECT_EQ(kind.value(), FrameKind::Init) << to_string(cmd);

        auto r = InitPacket::from_wire_format(frame);
        ASSERT_TRUE(r.ok()) << to_string(cmd);
        EXPECT_EQ(r.value().cid(), kCid);
        EXPECT_EQ(r.value().cmd(), cmd);
        EXPECT_EQ(r.value().size(), 0xBEEF);
        EXPECT_EQ(r.value().payload()[0], 0x01);
        EXPECT_EQ(r.value().payload()[2], 0x03);
        EXPECT_EQ(r.value().payload()[3], 0x00);
    }

    auto invalid = InitPacket::create(kCid, CommandCode::Invalid, 0, nullptr, 0);
    ASSERT_TRUE(invalid.ok());
    EXPECT_EQ(invalid.value().to_wire_format()[5], 0x80);
}

TEST(InitPacketTest, DecodeRestoresFields)
{
    std::vector<uint8_t> payload = {0xDE, 0xAD, 0xBE, 0xEF};
    auto built = InitPacket::create(kCid, CommandCode::Wink, 300, payload);
    ASSERT_TRUE(built.ok());

    auto r = InitPacket::from_wire_format(frame_of(built.value().to_wire_format()));
    ASSERT_TRUE(r.ok());

    const InitPacket& packet = r.value();
    EXPECT_EQ(packet.cid(), kCid);
    EXPECT_EQ(packet.cmd(), CommandCode::Wink);
    EXPECT_EQ(packet.command_byte(), 0x08);
    EXPECT_EQ(packet.size(), 300);
    EXPECT_EQ(packet.payload()[0], 0xDE);
    EXPECT_EQ(packet.payload()[3], 0xEF);
    EXPECT_EQ(packet.payload()[4], 0x00);
    EXPECT_EQ(packet.payload().size(), Protocol::INIT_PAYLOAD_SIZE);
}

TEST(InitPacketTest, UnknownCommandDecodesAsInvalidAndReencodesVerbatim)
{
    std::vector<uint8_t> frame(Protocol::FRAME_SIZE, 0x00);
    frame[0] = 0xCA;
    frame[1] = 0xFE;
    frame[2] = 0xBA;
    frame[3] = 0xBE;
    frame[4] = 0x80 | 0x7E;
    frame[5] = 0x00;
    frame[6] = 0x05;

    auto r = InitPacket::from_wire_format(frame);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().cmd(), CommandCode::Invalid);
    EXPECT_EQ(r.value().command_byte(), 0x7E);
    EXPECT_EQ(r.value().size(), 5);

    EXPECT_EQ(frame_of(r.value().to_wire_format()), frame);
}

TEST(InitPacketTest, WrongFrameLengthIsMalformed)
{
    std::vector<uint8_t> short_frame(Protocol::FRAME_SIZE - 1, 0x00);
    std::vector<uint8_t> report(Protocol::REPORT_SIZE, 0x00);

    auto r = InitPacket::from_wire_format(short_frame);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::MALFORMED_FRAME);

    r = InitPacket::from_wire_format(report);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::MALFORMED_FRAME);

    r = InitPacket::from_wire_format(nullptr, Protocol::FRAME_SIZE);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), Error::MALFORMED_FRAME);
}

TEST(InitPacketTest, ClassifiedAsInitFrame)
{
    auto r = InitPacket::create(Protocol::BROADCAST_CID, CommandCode::Init, 8, nullptr, 0);
    ASSERT_TRUE(r.ok());

    auto frame = frame_of(r.value().to_wire_format());
    auto kind = frame_kind(frame.data(), frame.size());
    ASSERT_TRUE(kind.ok());
    EXPECT_EQ(kind.value(), FrameKind::Init);
}
