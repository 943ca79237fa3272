#pragma once

#include "transport.hpp"
#include <optional>

namespace fileio {
namespace link {

struct TcpConfig {
    std::string host = "127.0.0.1";
    int port = 55555;
    int connect_timeout_ms = 3000;

    // Parse "host:port"; nullopt if malformed
    static std::optional<TcpConfig> parse(const std::string& endpoint);
};

// TCP client connection to a device bridge
class TcpTransport : public ITransport {
public:
    explicit TcpTransport(const TcpConfig& config);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override { return socket_fd_ >= 0; }

    bool write(ByteSpan data) override;
    int read(MutableByteSpan buf, int timeout_ms) override;

    std::string describe() const override;

private:
    TcpConfig config_;
    int socket_fd_ = -1;
};

} // namespace link
} // namespace fileio
