#include "messages.hpp"
#include <algorithm>

namespace fileio {
namespace protocol {

namespace {

void putU32(Bytes& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

uint32_t getU32(const Bytes& in, size_t pos) {
    return static_cast<uint32_t>(in[pos]) |
           (static_cast<uint32_t>(in[pos + 1]) << 8) |
           (static_cast<uint32_t>(in[pos + 2]) << 16) |
           (static_cast<uint32_t>(in[pos + 3]) << 24);
}

void putString(Bytes& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
}

// Reads a NUL-terminated string starting at pos; advances pos past the NUL.
// A missing terminator takes the rest of the payload.
std::string getString(const Bytes& in, size_t& pos) {
    auto begin = in.begin() + static_cast<std::ptrdiff_t>(pos);
    auto nul = std::find(begin, in.end(), uint8_t{0});
    std::string s(begin, nul);
    pos = static_cast<size_t>(nul - in.begin());
    if (nul != in.end()) {
        pos++;
    }
    return s;
}

} // anonymous namespace

const char* msgTypeToString(uint16_t type) {
    switch (type) {
        case MsgType::READ_REQ:      return "READ_REQ";
        case MsgType::READ_RESP:     return "READ_RESP";
        case MsgType::READ_DIR_REQ:  return "READ_DIR_REQ";
        case MsgType::READ_DIR_RESP: return "READ_DIR_RESP";
        case MsgType::WRITE_REQ:     return "WRITE_REQ";
        case MsgType::WRITE_RESP:    return "WRITE_RESP";
        case MsgType::REMOVE:        return "REMOVE";
        default:                     return "UNKNOWN";
    }
}

// ============================================================================
// Requests
// ============================================================================

Message ReadRequest::encode() const {
    Message msg;
    msg.type = MsgType::READ_REQ;
    putU32(msg.payload, sequence);
    putU32(msg.payload, offset);
    msg.payload.push_back(chunk_size);
    putString(msg.payload, filename);
    return msg;
}

std::optional<ReadRequest> ReadRequest::decode(const Message& msg) {
    if (msg.type != MsgType::READ_REQ || msg.payload.size() < 9) {
        return std::nullopt;
    }
    ReadRequest req;
    req.sequence = getU32(msg.payload, 0);
    req.offset = getU32(msg.payload, 4);
    req.chunk_size = msg.payload[8];
    size_t pos = 9;
    req.filename = getString(msg.payload, pos);
    return req;
}

Message ReadDirRequest::encode() const {
    Message msg;
    msg.type = MsgType::READ_DIR_REQ;
    putU32(msg.payload, sequence);
    putU32(msg.payload, offset);
    putString(msg.payload, dirname);
    return msg;
}

std::optional<ReadDirRequest> ReadDirRequest::decode(const Message& msg) {
    if (msg.type != MsgType::READ_DIR_REQ || msg.payload.size() < 8) {
        return std::nullopt;
    }
    ReadDirRequest req;
    req.sequence = getU32(msg.payload, 0);
    req.offset = getU32(msg.payload, 4);
    size_t pos = 8;
    req.dirname = getString(msg.payload, pos);
    return req;
}

Message WriteRequest::encode() const {
    Message msg;
    msg.type = MsgType::WRITE_REQ;
    msg.payload.reserve(WRITE_REQUEST_OVERHEAD + filename.size() + data.size());
    putU32(msg.payload, sequence);
    putU32(msg.payload, offset);
    putString(msg.payload, filename);
    msg.payload.insert(msg.payload.end(), data.begin(), data.end());
    return msg;
}

std::optional<WriteRequest> WriteRequest::decode(const Message& msg) {
    if (msg.type != MsgType::WRITE_REQ || msg.payload.size() < WRITE_REQUEST_OVERHEAD) {
        return std::nullopt;
    }
    WriteRequest req;
    req.sequence = getU32(msg.payload, 0);
    req.offset = getU32(msg.payload, 4);
    size_t pos = 8;
    req.filename = getString(msg.payload, pos);
    req.data.assign(msg.payload.begin() + static_cast<std::ptrdiff_t>(pos), msg.payload.end());
    return req;
}

Message RemoveRequest::encode() const {
    Message msg;
    msg.type = MsgType::REMOVE;
    putString(msg.payload, filename);
    return msg;
}

std::optional<RemoveRequest> RemoveRequest::decode(const Message& msg) {
    if (msg.type != MsgType::REMOVE) {
        return std::nullopt;
    }
    RemoveRequest req;
    size_t pos = 0;
    req.filename = getString(msg.payload, pos);
    return req;
}

// ============================================================================
// Replies
// ============================================================================

Message ReadReply::encode() const {
    Message msg;
    msg.type = MsgType::READ_RESP;
    putU32(msg.payload, sequence);
    msg.payload.insert(msg.payload.end(), contents.begin(), contents.end());
    return msg;
}

std::optional<ReadReply> ReadReply::decode(const Message& msg) {
    if (msg.type != MsgType::READ_RESP || msg.payload.size() < READ_REPLY_OVERHEAD) {
        return std::nullopt;
    }
    ReadReply reply;
    reply.sequence = getU32(msg.payload, 0);
    reply.contents.assign(msg.payload.begin() + READ_REPLY_OVERHEAD, msg.payload.end());
    return reply;
}

Message ReadDirReply::encode() const {
    Message msg;
    msg.type = MsgType::READ_DIR_RESP;
    putU32(msg.payload, sequence);
    msg.payload.insert(msg.payload.end(), contents.begin(), contents.end());
    return msg;
}

std::optional<ReadDirReply> ReadDirReply::decode(const Message& msg) {
    if (msg.type != MsgType::READ_DIR_RESP || msg.payload.size() < 4) {
        return std::nullopt;
    }
    ReadDirReply reply;
    reply.sequence = getU32(msg.payload, 0);
    reply.contents.assign(msg.payload.begin() + 4, msg.payload.end());
    return reply;
}

Message WriteReply::encode() const {
    Message msg;
    msg.type = MsgType::WRITE_RESP;
    putU32(msg.payload, sequence);
    return msg;
}

std::optional<WriteReply> WriteReply::decode(const Message& msg) {
    if (msg.type != MsgType::WRITE_RESP || msg.payload.size() < 4) {
        return std::nullopt;
    }
    WriteReply reply;
    reply.sequence = getU32(msg.payload, 0);
    return reply;
}

std::optional<uint32_t> sequenceOf(const Message& msg) {
    switch (msg.type) {
        case MsgType::READ_REQ:
        case MsgType::READ_RESP:
        case MsgType::READ_DIR_REQ:
        case MsgType::READ_DIR_RESP:
        case MsgType::WRITE_REQ:
        case MsgType::WRITE_RESP:
            if (msg.payload.size() >= 4) {
                return getU32(msg.payload, 0);
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

} // namespace protocol
} // namespace fileio
