#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace fileio {

// Core types
using Bytes = std::vector<uint8_t>;            // Message payload / file data

// Spans for zero-copy operations
using ByteSpan = std::span<const uint8_t>;
using MutableByteSpan = std::span<uint8_t>;

// SBP sender id used by the host side of the link
constexpr uint16_t HOST_SENDER_ID = 0x0042;

// Largest SBP payload (length field is one byte)
constexpr size_t MAX_PAYLOAD_SIZE = 255;

} // namespace fileio
