#pragma once

#include "transport.hpp"

namespace fileio {
namespace link {

struct SerialConfig {
    std::string port = "/dev/ttyUSB0";
    int baud_rate = 115200;
};

// Raw 8N1 serial port
class SerialTransport : public ITransport {
public:
    explicit SerialTransport(const SerialConfig& config);
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    bool write(ByteSpan data) override;
    int read(MutableByteSpan buf, int timeout_ms) override;

    std::string describe() const override;

private:
    SerialConfig config_;
    int fd_ = -1;
};

} // namespace link
} // namespace fileio
