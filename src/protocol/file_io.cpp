#include "file_io.hpp"
#include "errors.hpp"
#include "fileio/logging.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <optional>
#include <stdexcept>

namespace fileio {
namespace protocol {

namespace {

// Reassembly state of one read. Written by the chunk callback on the link
// thread (under the repeater lock); read by the caller once flush() returns.
struct ReadState {
    std::map<uint32_t, Bytes> chunks;           // By file offset
    std::optional<uint64_t> length;             // Known once a short chunk arrives
    std::atomic<bool> done{false};
};

Bytes assemble(const ReadState& state) {
    const uint64_t length = state.length.value_or(0);
    Bytes out;
    out.reserve(static_cast<size_t>(length));

    for (const auto& [offset, data] : state.chunks) {
        if (offset >= length) {
            break;
        }
        size_t take = static_cast<size_t>(std::min<uint64_t>(data.size(), length - offset));
        out.resize(offset, 0);
        out.insert(out.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
    }

    out.resize(static_cast<size_t>(length), 0);
    return out;
}

std::vector<std::string> splitNames(const Bytes& contents) {
    // Trailing terminators carry no names
    size_t end = contents.size();
    while (end > 0 && contents[end - 1] == 0) {
        end--;
    }

    std::vector<std::string> names;
    if (end == 0) {
        return names;
    }

    size_t start = 0;
    for (size_t i = 0; i <= end; i++) {
        if (i == end || contents[i] == 0) {
            names.emplace_back(contents.begin() + static_cast<std::ptrdiff_t>(start),
                               contents.begin() + static_cast<std::ptrdiff_t>(i));
            start = i + 1;
        }
    }
    return names;
}

} // anonymous namespace

FileIO::FileIO(link::ILink& link, const FileIOConfig& config)
    : link_(link)
    , config_(config)
{
}

FileIO::FileIO(link::ILink& link, SequenceGenerator sequence, const FileIOConfig& config)
    : link_(link)
    , sequence_(sequence)
    , config_(config)
{
}

size_t FileIO::readChunkSize() const {
    // chunk_size travels in one byte
    return std::min<size_t>(config_.max_payload - READ_REPLY_OVERHEAD, 255);
}

size_t FileIO::writeChunkSize(const std::string& filename) const {
    const size_t overhead = filename.size() + WRITE_REQUEST_OVERHEAD;
    if (overhead >= config_.max_payload) {
        return 0;
    }
    return config_.max_payload - overhead;
}

// ============================================================================
// Read
// ============================================================================

Bytes FileIO::read(const std::string& filename) {
    const size_t chunk_size = readChunkSize();
    ReadState state;

    auto on_chunk = [&state](const Message& req_msg, const Message& reply_msg) {
        auto req = ReadRequest::decode(req_msg);
        auto reply = ReadReply::decode(reply_msg);
        if (!req || !reply) {
            LOG_FILEIO(WARN, "Malformed read reply ignored");
            return;
        }

        if (reply->contents.size() < req->chunk_size) {
            uint64_t end = static_cast<uint64_t>(req->offset) + reply->contents.size();
            if (!state.length || end < *state.length) {
                state.length = end;
            }
            state.done = true;
        }
        state.chunks[req->offset] = std::move(reply->contents);
    };

    LOG_FILEIO(INFO, "Reading '%s' (chunk=%zu)", filename.c_str(), chunk_size);

    {
        SelectiveRepeater sr(link_, MsgType::READ_RESP, on_chunk, config_.repeater);

        uint32_t offset = 0;
        while (!state.done) {
            ReadRequest req;
            req.sequence = nextSeq();
            req.offset = offset;
            req.chunk_size = static_cast<uint8_t>(chunk_size);
            req.filename = filename;
            sr.send(req.encode());
            offset += static_cast<uint32_t>(chunk_size);
        }

        // Chunks before the short one may still be outstanding
        sr.flush();
        last_stats_ = sr.getStats();
    }

    Bytes data = assemble(state);
    LOG_FILEIO(INFO, "Read '%s': %zu bytes", filename.c_str(), data.size());
    return data;
}

// ============================================================================
// Write
// ============================================================================

void FileIO::write(const std::string& filename, ByteSpan data,
                   uint32_t offset, bool truncate, ProgressCallback progress) {
    const size_t chunk_size = writeChunkSize(filename);
    if (chunk_size == 0) {
        throw std::invalid_argument("filename too long for a write request: " + filename);
    }

    if (truncate && offset == 0) {
        remove(filename);
    }

    LOG_FILEIO(INFO, "Writing '%s': %zu bytes at %u (chunk=%zu)",
               filename.c_str(), data.size(), offset, chunk_size);

    SelectiveRepeater sr(link_, MsgType::WRITE_RESP, nullptr, config_.repeater);

    size_t cursor = 0;
    while (cursor < data.size()) {
        size_t n = std::min(chunk_size, data.size() - cursor);
        auto chunk = data.subspan(cursor, n);

        WriteRequest req;
        req.sequence = nextSeq();
        req.offset = offset + static_cast<uint32_t>(cursor);
        req.filename = filename;
        req.data.assign(chunk.begin(), chunk.end());
        sr.send(req.encode());

        cursor += n;
        if (progress) {
            progress(cursor);
        }
    }

    sr.flush();
    last_stats_ = sr.getStats();

    LOG_FILEIO(INFO, "Wrote '%s': %zu bytes in %d requests (%d resent)",
               filename.c_str(), data.size(), last_stats_.requests_sent,
               last_stats_.retransmissions);
}

// ============================================================================
// Directory listing
// ============================================================================

std::vector<std::string> FileIO::readdir(const std::string& dirname) {
    std::vector<std::string> files;
    const auto timeout = std::chrono::milliseconds(config_.readdir_timeout_ms);

    while (true) {
        ReadDirRequest req;
        req.sequence = nextSeq();
        req.offset = static_cast<uint32_t>(files.size());
        req.dirname = dirname;

        link::ReplyWaiter waiter(link_, MsgType::READ_DIR_RESP);
        link_.send(req.encode());

        auto msg = waiter.wait(timeout);
        if (!msg) {
            throw ProtocolError("Timeout waiting for READ_DIR reply");
        }

        auto reply = ReadDirReply::decode(*msg);
        if (!reply) {
            throw ProtocolError("Malformed READ_DIR reply");
        }
        if (reply->sequence != req.sequence) {
            throw ProtocolError("READ_DIR reply doesn't match request (seq " +
                                std::to_string(reply->sequence) + ", expected " +
                                std::to_string(req.sequence) + ")");
        }

        auto names = splitNames(reply->contents);
        if (names.empty()) {
            LOG_FILEIO(DEBUG, "Listing of '%s' complete: %zu entries",
                       dirname.c_str(), files.size());
            return files;
        }

        LOG_FILEIO(TRACE, "READ_DIR page at %u: %zu names", req.offset, names.size());
        files.insert(files.end(), names.begin(), names.end());
    }
}

// ============================================================================
// Remove
// ============================================================================

void FileIO::remove(const std::string& filename) {
    RemoveRequest req;
    req.filename = filename;
    link_.send(req.encode());
    LOG_FILEIO(DEBUG, "Removed '%s'", filename.c_str());
}

} // namespace protocol
} // namespace fileio
