#pragma once

#include "fileio/types.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace fileio {
namespace protocol {

// SBP message type ids for the file I/O service
namespace MsgType {
    constexpr uint16_t READ_RESP      = 0x00A3;
    constexpr uint16_t READ_REQ       = 0x00A8;
    constexpr uint16_t READ_DIR_REQ   = 0x00A9;
    constexpr uint16_t READ_DIR_RESP  = 0x00AA;
    constexpr uint16_t WRITE_RESP     = 0x00AB;
    constexpr uint16_t REMOVE         = 0x00AC;
    constexpr uint16_t WRITE_REQ      = 0x00AD;
}

const char* msgTypeToString(uint16_t type);

// One SBP message as it travels over the link (framing is done elsewhere)
struct Message {
    uint16_t type = 0;
    uint16_t sender = HOST_SENDER_ID;
    Bytes payload;
};

// Bytes every reply spends before its contents (u32 sequence)
constexpr size_t READ_REPLY_OVERHEAD = 4;

// Bytes a write request spends besides filename and data
// (u32 sequence + u32 offset + filename terminator)
constexpr size_t WRITE_REQUEST_OVERHEAD = 9;

// ============================================================================
// Requests (host -> device)
// ============================================================================

struct ReadRequest {
    uint32_t sequence = 0;
    uint32_t offset = 0;
    uint8_t chunk_size = 0;
    std::string filename;

    Message encode() const;
    static std::optional<ReadRequest> decode(const Message& msg);
};

struct ReadDirRequest {
    uint32_t sequence = 0;
    uint32_t offset = 0;
    std::string dirname;

    Message encode() const;
    static std::optional<ReadDirRequest> decode(const Message& msg);
};

struct WriteRequest {
    uint32_t sequence = 0;
    uint32_t offset = 0;
    std::string filename;
    Bytes data;             // Follows the NUL-terminated filename

    Message encode() const;
    static std::optional<WriteRequest> decode(const Message& msg);
};

struct RemoveRequest {
    std::string filename;

    Message encode() const;
    static std::optional<RemoveRequest> decode(const Message& msg);
};

// ============================================================================
// Replies (device -> host)
// ============================================================================

// Contents are the chunk at the offset of the request with this sequence
struct ReadReply {
    uint32_t sequence = 0;
    Bytes contents;

    Message encode() const;
    static std::optional<ReadReply> decode(const Message& msg);
};

// Contents are NUL-joined names
struct ReadDirReply {
    uint32_t sequence = 0;
    Bytes contents;

    Message encode() const;
    static std::optional<ReadDirReply> decode(const Message& msg);
};

struct WriteReply {
    uint32_t sequence = 0;

    Message encode() const;
    static std::optional<WriteReply> decode(const Message& msg);
};

// Sequence number carried by a request or reply message, if it has one
std::optional<uint32_t> sequenceOf(const Message& msg);

} // namespace protocol
} // namespace fileio
