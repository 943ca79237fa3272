#pragma once

#include "link.hpp"
#include "transport.hpp"
#include "protocol/sbp_frame.hpp"
#include <atomic>
#include <memory>
#include <thread>

namespace fileio {
namespace link {

/**
 * SBP link over a byte transport
 *
 * Frames outgoing messages, and runs a receive thread that decodes the
 * incoming stream and dispatches each message to the registered handlers.
 * The transport must already be open.
 */
class SbpLink : public LinkBase {
public:
    explicit SbpLink(std::unique_ptr<ITransport> transport,
                     uint16_t sender_id = HOST_SENDER_ID);
    ~SbpLink() override;

    SbpLink(const SbpLink&) = delete;
    SbpLink& operator=(const SbpLink&) = delete;

    void send(const Message& msg) override;

    bool isOpen() const override;

    // Stop the receive thread and close the transport. Safe to call from
    // any thread other than the receive thread, and more than once.
    void close() override;

private:
    // Poll granularity of the receive thread (bounds close() latency)
    static constexpr int READ_TIMEOUT_MS = 100;

    std::unique_ptr<ITransport> transport_;
    uint16_t sender_id_;

    std::atomic<bool> running_{false};
    std::thread rx_thread_;

    std::mutex tx_mutex_;               // Serializes writes and close()
    protocol::FrameDecoder decoder_;    // Receive thread only

    void rxLoop();
};

} // namespace link
} // namespace fileio
