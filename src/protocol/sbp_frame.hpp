#pragma once

#include "messages.hpp"
#include <vector>

namespace fileio {
namespace protocol {

// ============================================================================
// SBP framing
// ============================================================================
//
// ┌──────────┬─────────┬─────────┬────────┬──────────────┬─────────┐
// │ PREAMBLE │  TYPE   │ SENDER  │ LENGTH │   PAYLOAD    │  CRC16  │
// │   0x55   │ 2B (LE) │ 2B (LE) │   1B   │ LENGTH bytes │ 2B (LE) │
// └──────────┴─────────┴─────────┴────────┴──────────────┴─────────┘
//
// CRC-16/XMODEM (poly 0x1021, init 0) covers TYPE through PAYLOAD.
// ============================================================================

constexpr uint8_t SBP_PREAMBLE = 0x55;
constexpr size_t SBP_HEADER_SIZE = 6;     // preamble + type + sender + length
constexpr size_t SBP_CRC_SIZE = 2;

uint16_t crc16(ByteSpan data, uint16_t crc = 0);

// Serialize a message into one frame. Payloads over 255 bytes are rejected
// with std::invalid_argument.
Bytes encodeFrame(const Message& msg);

/**
 * Streaming frame decoder
 *
 * Accepts arbitrary slices of the byte stream and yields complete,
 * CRC-checked messages. Garbage between frames and frames with a bad CRC
 * are skipped; the decoder resynchronises on the next preamble.
 */
class FrameDecoder {
public:
    struct Stats {
        int frames_decoded = 0;
        int crc_errors = 0;
        int bytes_discarded = 0;
    };

    // Append received bytes, returning every message completed by them
    std::vector<Message> push(ByteSpan data);

    const Stats& stats() const { return stats_; }

private:
    Bytes rx_buffer_;
    Stats stats_;
};

} // namespace protocol
} // namespace fileio
