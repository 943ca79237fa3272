#pragma once

#include "fileio/types.hpp"
#include <string>

namespace fileio {
namespace link {

/**
 * Byte stream to the device (serial port or TCP socket)
 *
 * read() and write() may be called from different threads; close() must
 * not race with either (SbpLink stops its reader before closing).
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Write all bytes. Returns false on failure.
    virtual bool write(ByteSpan data) = 0;

    // Read up to buf.size() bytes, waiting at most timeout_ms.
    // Returns bytes read, 0 on timeout, -1 on error or end of stream.
    virtual int read(MutableByteSpan buf, int timeout_ms) = 0;

    // Human readable endpoint for log messages
    virtual std::string describe() const = 0;
};

} // namespace link
} // namespace fileio
