#pragma once

#include "selective_repeater.hpp"
#include "link/link.hpp"
#include <functional>
#include <string>
#include <vector>

namespace fileio {
namespace protocol {

struct FileIOConfig {
    size_t max_payload = MAX_PAYLOAD_SIZE;      // Largest message payload the link carries
    uint32_t readdir_timeout_ms = 1000;         // Wait per directory page
    RepeaterConfig repeater;
};

/**
 * File access on the remote device
 *
 * read() and write() pipeline fixed-size chunk requests through a
 * SelectiveRepeater created for the duration of the call. readdir() pages
 * through a listing one request at a time. remove() is fire-and-forget.
 *
 * All operations run on the calling thread and report failure by throwing
 * (TransferTimeout, ProtocolError, LinkError). A failed write leaves the
 * remote file partially written; a failed read returns nothing.
 */
class FileIO {
public:
    // Cumulative bytes handed to the link so far (not bytes acknowledged)
    using ProgressCallback = std::function<void(size_t bytes_scheduled)>;

    explicit FileIO(link::ILink& link, const FileIOConfig& config = FileIOConfig{});
    FileIO(link::ILink& link, SequenceGenerator sequence,
           const FileIOConfig& config = FileIOConfig{});

    // Whole contents of a file. A missing file reads as empty.
    Bytes read(const std::string& filename);

    // Names in a directory, in device order
    std::vector<std::string> readdir(const std::string& dirname = ".");

    void remove(const std::string& filename);

    // Write data at offset. With truncate (and offset 0) the file is removed
    // first; otherwise bytes past the end of data are left as they were.
    void write(const std::string& filename, ByteSpan data,
               uint32_t offset = 0, bool truncate = true,
               ProgressCallback progress = nullptr);

    // Data bytes per read / write request
    size_t readChunkSize() const;
    size_t writeChunkSize(const std::string& filename) const;

    uint32_t nextSeq() { return sequence_.next(); }

    // Repeater statistics of the most recent read() or write()
    RepeaterStats lastStats() const { return last_stats_; }

private:
    link::ILink& link_;
    SequenceGenerator sequence_;
    FileIOConfig config_;
    RepeaterStats last_stats_;
};

} // namespace protocol
} // namespace fileio
