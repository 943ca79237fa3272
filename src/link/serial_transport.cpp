#include "serial_transport.hpp"
#include "fileio/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace fileio {
namespace link {

namespace {

speed_t baudToSpeed(int baud_rate) {
    switch (baud_rate) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        case 460800: return B460800;
        case 921600: return B921600;
        case 1000000: return B1000000;
        default: return B115200;
    }
}

} // namespace

SerialTransport::SerialTransport(const SerialConfig& config)
    : config_(config)
{
}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::open() {
    if (config_.port.empty()) {
        LOG_LINK(ERROR, "Serial: port is empty");
        return false;
    }

    close();

    fd_ = ::open(config_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        LOG_LINK(ERROR, "Serial: failed to open '%s' (%s)",
                 config_.port.c_str(), std::strerror(errno));
        return false;
    }

    termios tio{};
    if (tcgetattr(fd_, &tio) != 0) {
        LOG_LINK(ERROR, "Serial: tcgetattr failed on '%s' (%s)",
                 config_.port.c_str(), std::strerror(errno));
        close();
        return false;
    }

    cfmakeraw(&tio);
    speed_t speed = baudToSpeed(config_.baud_rate);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | CRTSCTS);

    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
        LOG_LINK(ERROR, "Serial: tcsetattr failed on '%s' (%s)",
                 config_.port.c_str(), std::strerror(errno));
        close();
        return false;
    }

    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK);
    }

    tcflush(fd_, TCIOFLUSH);

    LOG_LINK(INFO, "Serial: opened '%s' @ %d", config_.port.c_str(), config_.baud_rate);
    return true;
}

void SerialTransport::close() {
    if (fd_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
    LOG_LINK(DEBUG, "Serial: closed '%s'", config_.port.c_str());
}

bool SerialTransport::write(ByteSpan data) {
    if (fd_ < 0) {
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_LINK(ERROR, "Serial: write failed (%s)", std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

int SerialTransport::read(MutableByteSpan buf, int timeout_ms) {
    if (fd_ < 0) {
        return -1;
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready == 0) {
        return 0;
    }
    if (ready < 0) {
        if (errno == EINTR) {
            return 0;
        }
        LOG_LINK(ERROR, "Serial: poll failed (%s)", std::strerror(errno));
        return -1;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        LOG_LINK(ERROR, "Serial: device '%s' went away", config_.port.c_str());
        return -1;
    }

    ssize_t n = ::read(fd_, buf.data(), buf.size());
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return 0;
        }
        LOG_LINK(ERROR, "Serial: read failed (%s)", std::strerror(errno));
        return -1;
    }
    return static_cast<int>(n);
}

std::string SerialTransport::describe() const {
    return config_.port + " @ " + std::to_string(config_.baud_rate);
}

} // namespace link
} // namespace fileio
