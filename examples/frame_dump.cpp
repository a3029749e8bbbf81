#include <iostream>
#include <string>
#include <algorithm>
#include "ctaphid/common/helpers.hpp"
#include "ctaphid/common/command.hpp"
#include "ctaphid/transport/init_packet.hpp"
#include "ctaphid/transport/cont_packet.hpp"

using namespace ctaphid;

static void usage()
{
    std::cerr << "Usage:\n"
              << "  frame_dump decode <frame hex, 64 bytes>\n"
              << "  frame_dump init <cid hex> <cmd hex> <bcnt> [payload hex]\n"
              << "  frame_dump cont <cid hex> <seq> [payload hex]\n";
}

static bool parse_cid(const std::string& text, ChannelId& cid)
{
    auto bytes = hexToBytes(text);
    if (!bytes || bytes->size() != cid.size()) {
        std::cerr << "Channel id must be " << cid.size() << " hex bytes\n";
        return false;
    }
    std::copy(bytes->begin(), bytes->end(), cid.begin());
    return true;
}

static void print_report(const Report& report)
{
    std::cout << "Report: " << bytesToHex(report.data(), report.size()) << "\n";
}

static int decode(const std::string& hex)
{
    auto bytes = hexToBytes(hex);
    if (!bytes) {
        std::cerr << "Frame is not valid hex\n";
        return 1;
    }

    auto kind = frame_kind(bytes->data(), bytes->size());
    if (!kind.ok()) {
        std::cerr << "Decode failed: " << to_string(kind.error()) << "\n";
        return 1;
    }

    std::cout << "Kind:    " << to_string(kind.value()) << "\n";

    if (kind.value() == FrameKind::Init) {
        auto r = InitPacket::from_wire_format(*bytes);
        if (!r.ok()) {
            std::cerr << "Decode failed: " << to_string(r.error()) << "\n";
            return 1;
        }
        auto& packet = r.value();
        std::cout << "CID:     " << bytesToHex(packet.cid().data(), packet.cid().size()) << "\n";
        std::cout << "Command: " << to_string(packet.cmd()) << " (0x" << std::hex
                  << static_cast<int>(packet.command_byte()) << std::dec << ")\n";
        std::cout << "BCNT:    " << packet.size() << "\n";
        std::cout << "Payload: " << bytesToHex(packet.payload().data(), packet.payload().size()) << "\n";
        return 0;
    }

    auto r = ContPacket::from_wire_format(*bytes);
    if (!r.ok()) {
        std::cerr << "Decode failed: " << to_string(r.error()) << "\n";
        return 1;
    }
    auto& packet = r.value();
    std::cout << "CID:     " << bytesToHex(packet.cid().data(), packet.cid().size()) << "\n";
    std::cout << "SEQ:     " << static_cast<int>(packet.seq()) << "\n";
    std::cout << "Payload: " << bytesToHex(packet.payload().data(), packet.payload().size()) << "\n";
    return 0;
}

int main(int argc, char** argv)
{
    if (argc < 3) {
        usage();
        return 1;
    }

    std::string mode = argv[1];

    if (mode == "decode") {
        return decode(argv[2]);
    }

    ChannelId cid{};
    if (!parse_cid(argv[2], cid)) {
        return 1;
    }

    if (mode == "init" && argc >= 5) {
        auto cmd_byte = hexToBytes(argv[3]);
        if (!cmd_byte || cmd_byte->size() != 1) {
            std::cerr << "Command must be one hex byte\n";
            return 1;
        }
        auto payload = hexToBytes(argc > 5 ? argv[5] : "");
        if (!payload) {
            std::cerr << "Payload is not valid hex\n";
            return 1;
        }
        auto bcnt = parseDecimal(argv[4], 0xFFFF);
        if (!bcnt) {
            std::cerr << "BCNT must be a decimal number 0-65535\n";
            return 1;
        }

        // Unknown bytes are refused by InitPacket::create
        auto cmd = static_cast<CommandCode>(cmd_byte->front());
        auto r = InitPacket::create(cid, cmd, static_cast<uint16_t>(*bcnt), *payload);
        if (!r.ok()) {
            std::cerr << "Encode failed: " << to_string(r.error()) << "\n";
            return 1;
        }
        print_report(r.value().to_wire_format());
        return 0;
    }

    if (mode == "cont" && argc >= 4) {
        auto payload = hexToBytes(argc > 4 ? argv[4] : "");
        if (!payload) {
            std::cerr << "Payload is not valid hex\n";
            return 1;
        }
        auto seq = parseDecimal(argv[3], 0xFF);
        if (!seq) {
            std::cerr << "Sequence must be a decimal number 0-255\n";
            return 1;
        }

        auto r = ContPacket::create(cid, static_cast<uint8_t>(*seq), *payload);
        if (!r.ok()) {
            std::cerr << "Encode failed: " << to_string(r.error()) << "\n";
            return 1;
        }
        print_report(r.value().to_wire_format());
        return 0;
    }

    usage();
    return 1;
}
