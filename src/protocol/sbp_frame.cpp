#include "sbp_frame.hpp"
#include "fileio/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace fileio {
namespace protocol {

uint16_t crc16(ByteSpan data, uint16_t crc) {
    for (uint8_t byte : data) {
        crc ^= static_cast<uint16_t>(byte) << 8;
        for (int i = 0; i < 8; i++) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

Bytes encodeFrame(const Message& msg) {
    if (msg.payload.size() > MAX_PAYLOAD_SIZE) {
        throw std::invalid_argument("SBP payload too large: " +
                                    std::to_string(msg.payload.size()) + " bytes");
    }

    Bytes frame;
    frame.reserve(SBP_HEADER_SIZE + msg.payload.size() + SBP_CRC_SIZE);

    frame.push_back(SBP_PREAMBLE);
    frame.push_back(static_cast<uint8_t>(msg.type & 0xFF));
    frame.push_back(static_cast<uint8_t>(msg.type >> 8));
    frame.push_back(static_cast<uint8_t>(msg.sender & 0xFF));
    frame.push_back(static_cast<uint8_t>(msg.sender >> 8));
    frame.push_back(static_cast<uint8_t>(msg.payload.size()));
    frame.insert(frame.end(), msg.payload.begin(), msg.payload.end());

    uint16_t crc = crc16(ByteSpan(frame).subspan(1));
    frame.push_back(static_cast<uint8_t>(crc & 0xFF));
    frame.push_back(static_cast<uint8_t>(crc >> 8));

    return frame;
}

std::vector<Message> FrameDecoder::push(ByteSpan data) {
    rx_buffer_.insert(rx_buffer_.end(), data.begin(), data.end());

    std::vector<Message> out;
    size_t pos = 0;

    while (true) {
        // Find next preamble
        auto it = std::find(rx_buffer_.begin() + static_cast<std::ptrdiff_t>(pos),
                            rx_buffer_.end(), SBP_PREAMBLE);
        size_t start = static_cast<size_t>(it - rx_buffer_.begin());
        stats_.bytes_discarded += static_cast<int>(start - pos);
        pos = start;

        if (rx_buffer_.size() - pos < SBP_HEADER_SIZE) {
            break;
        }

        size_t len = rx_buffer_[pos + 5];
        size_t total = SBP_HEADER_SIZE + len + SBP_CRC_SIZE;
        if (rx_buffer_.size() - pos < total) {
            break;
        }

        ByteSpan body(rx_buffer_.data() + pos + 1, SBP_HEADER_SIZE - 1 + len);
        uint16_t expected = static_cast<uint16_t>(rx_buffer_[pos + total - 2]) |
                            static_cast<uint16_t>(rx_buffer_[pos + total - 1] << 8);

        if (crc16(body) != expected) {
            // Treat this preamble as noise and look for the next one
            stats_.crc_errors++;
            stats_.bytes_discarded++;
            LOG_LINK(DEBUG, "Frame CRC mismatch (type=0x%02X%02X len=%zu), resyncing",
                     rx_buffer_[pos + 2], rx_buffer_[pos + 1], len);
            pos++;
            continue;
        }

        Message msg;
        msg.type = static_cast<uint16_t>(rx_buffer_[pos + 1] | (rx_buffer_[pos + 2] << 8));
        msg.sender = static_cast<uint16_t>(rx_buffer_[pos + 3] | (rx_buffer_[pos + 4] << 8));
        msg.payload.assign(rx_buffer_.begin() + static_cast<std::ptrdiff_t>(pos + SBP_HEADER_SIZE),
                           rx_buffer_.begin() + static_cast<std::ptrdiff_t>(pos + SBP_HEADER_SIZE + len));

        LOG_LINK(TRACE, "RX %s sender=0x%04X len=%zu",
                 msgTypeToString(msg.type), msg.sender, len);

        stats_.frames_decoded++;
        out.push_back(std::move(msg));
        pos += total;
    }

    rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + static_cast<std::ptrdiff_t>(pos));
    return out;
}

} // namespace protocol
} // namespace fileio
