#pragma once
#include <stdint.h>
#include <stddef.h>
#include <array>

namespace ctaphid::Protocol
{
    // Report sizes (bytes)
    constexpr size_t REPORT_SIZE = 65;      // report-ID slot + frame
    constexpr size_t FRAME_SIZE = 64;
    constexpr size_t CID_SIZE = 4;

    // Frame marker, bit 7 of the byte after the channel id
    constexpr uint8_t FRAME_INIT = 0x80;
    constexpr uint8_t MAX_SEQUENCE = 0x7F;

    // Offsets into the 65-byte report
    namespace Offset {
        constexpr size_t REPORT_ID = 0;
        constexpr size_t CID = 1;
        constexpr size_t CMD = 5;
        constexpr size_t SEQ = 5;
        constexpr size_t BCNT = 6;
        constexpr size_t INIT_DATA = 8;
        constexpr size_t CONT_DATA = 6;
    }

    constexpr size_t INIT_HEADER_SIZE = 7;
    constexpr size_t CONT_HEADER_SIZE = 5;
    constexpr size_t INIT_PAYLOAD_SIZE = FRAME_SIZE - INIT_HEADER_SIZE;   // 57
    constexpr size_t CONT_PAYLOAD_SIZE = FRAME_SIZE - CONT_HEADER_SIZE;   // 59

    // One init frame plus 128 continuation frames
    constexpr size_t MAX_MESSAGE_SIZE = INIT_PAYLOAD_SIZE + (MAX_SEQUENCE + 1) * CONT_PAYLOAD_SIZE;

    constexpr std::array<uint8_t, CID_SIZE> BROADCAST_CID = { 0xFF, 0xFF, 0xFF, 0xFF };
}
