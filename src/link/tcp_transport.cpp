#include "tcp_transport.hpp"
#include "fileio/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace fileio {
namespace link {

std::optional<TcpConfig> TcpConfig::parse(const std::string& endpoint) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
        return std::nullopt;
    }

    const std::string port_str = endpoint.substr(colon + 1);
    char* end = nullptr;
    long port = std::strtol(port_str.c_str(), &end, 10);
    if (end == port_str.c_str() || *end != '\0' || port <= 0 || port > 65535) {
        return std::nullopt;
    }

    TcpConfig config;
    config.host = endpoint.substr(0, colon);
    config.port = static_cast<int>(port);
    return config;
}

TcpTransport::TcpTransport(const TcpConfig& config)
    : config_(config)
{
}

TcpTransport::~TcpTransport() {
    close();
}

bool TcpTransport::open() {
    close();

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char port_str[16];
    snprintf(port_str, sizeof(port_str), "%d", config_.port);

    int ret = getaddrinfo(config_.host.c_str(), port_str, &hints, &result);
    if (ret != 0) {
        LOG_LINK(ERROR, "TCP: failed to resolve host '%s' (%s)",
                 config_.host.c_str(), gai_strerror(ret));
        return false;
    }

    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        socket_fd_ = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (socket_fd_ < 0) {
            continue;
        }

        struct timeval tv;
        tv.tv_sec = config_.connect_timeout_ms / 1000;
        tv.tv_usec = (config_.connect_timeout_ms % 1000) * 1000;
        setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(socket_fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }

        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    freeaddrinfo(result);

    if (socket_fd_ < 0) {
        LOG_LINK(ERROR, "TCP: failed to connect to %s:%d (%s)",
                 config_.host.c_str(), config_.port, std::strerror(errno));
        return false;
    }

    // Small request frames should not sit in the Nagle buffer
    int one = 1;
    setsockopt(socket_fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    LOG_LINK(INFO, "TCP: connected to %s:%d", config_.host.c_str(), config_.port);
    return true;
}

void TcpTransport::close() {
    if (socket_fd_ < 0) {
        return;
    }
    ::shutdown(socket_fd_, SHUT_RDWR);
    ::close(socket_fd_);
    socket_fd_ = -1;
    LOG_LINK(DEBUG, "TCP: disconnected from %s:%d", config_.host.c_str(), config_.port);
}

bool TcpTransport::write(ByteSpan data) {
    if (socket_fd_ < 0) {
        return false;
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(socket_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_LINK(ERROR, "TCP: send failed (%s)", std::strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

int TcpTransport::read(MutableByteSpan buf, int timeout_ms) {
    if (socket_fd_ < 0) {
        return -1;
    }

    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready == 0) {
        return 0;
    }
    if (ready < 0) {
        if (errno == EINTR) {
            return 0;
        }
        LOG_LINK(ERROR, "TCP: poll failed (%s)", std::strerror(errno));
        return -1;
    }

    ssize_t len = recv(socket_fd_, buf.data(), buf.size(), 0);
    if (len == 0) {
        LOG_LINK(WARN, "TCP: connection closed by %s:%d", config_.host.c_str(), config_.port);
        return -1;
    }
    if (len < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return 0;
        }
        LOG_LINK(ERROR, "TCP: recv failed (%s)", std::strerror(errno));
        return -1;
    }
    return static_cast<int>(len);
}

std::string TcpTransport::describe() const {
    return config_.host + ":" + std::to_string(config_.port);
}

} // namespace link
} // namespace fileio
