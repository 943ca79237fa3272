#include "sbp_link.hpp"
#include "protocol/errors.hpp"
#include "fileio/logging.hpp"
#include <array>

namespace fileio {
namespace link {

SbpLink::SbpLink(std::unique_ptr<ITransport> transport, uint16_t sender_id)
    : transport_(std::move(transport))
    , sender_id_(sender_id)
{
    if (!transport_ || !transport_->isOpen()) {
        throw LinkError("SbpLink requires an open transport");
    }

    running_ = true;
    rx_thread_ = std::thread([this] { rxLoop(); });

    LOG_LINK(DEBUG, "Link up on %s", transport_->describe().c_str());
}

SbpLink::~SbpLink() {
    close();
}

void SbpLink::send(const Message& msg) {
    Message out = msg;
    out.sender = sender_id_;
    Bytes frame = protocol::encodeFrame(out);

    std::lock_guard<std::mutex> lock(tx_mutex_);
    if (!running_ || !transport_->isOpen()) {
        throw LinkError("link closed");
    }

    LOG_LINK(TRACE, "TX %s len=%zu", protocol::msgTypeToString(out.type), out.payload.size());

    if (!transport_->write(frame)) {
        throw LinkError("write to " + transport_->describe() + " failed");
    }
}

bool SbpLink::isOpen() const {
    return running_;
}

void SbpLink::close() {
    running_ = false;
    if (rx_thread_.joinable()) {
        rx_thread_.join();
    }

    std::lock_guard<std::mutex> lock(tx_mutex_);
    if (transport_->isOpen()) {
        transport_->close();
        LOG_LINK(DEBUG, "Link down on %s", transport_->describe().c_str());
    }
}

void SbpLink::rxLoop() {
    std::array<uint8_t, 512> buf;

    while (running_) {
        int n = transport_->read(buf, READ_TIMEOUT_MS);
        if (n < 0) {
            LOG_LINK(ERROR, "Receive failed on %s, link down", transport_->describe().c_str());
            running_ = false;
            break;
        }
        if (n == 0) {
            continue;
        }

        std::vector<Message> messages = decoder_.push(ByteSpan(buf.data(), static_cast<size_t>(n)));

        for (const auto& msg : messages) {
            try {
                dispatch(msg);
            } catch (const std::exception& e) {
                LOG_LINK(ERROR, "Handler for %s threw: %s",
                         protocol::msgTypeToString(msg.type), e.what());
            }
        }
    }
}

} // namespace link
} // namespace fileio
