#pragma once

#include "messages.hpp"
#include "link/link.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace fileio {
namespace protocol {

using Clock = std::chrono::steady_clock;

// Window/retry parameters (defaults match the device firmware)
struct RepeaterConfig {
    size_t window_size = 40;            // Max requests in flight
    uint32_t timeout_ms = 5000;         // Age before a request is resent
    int min_retries = 3;                // Resends before the transfer fails
    uint32_t link_check_ms = 250;       // How often a blocked wait checks the link
};

struct RepeaterStats {
    int requests_sent = 0;
    int retransmissions = 0;
    int completions = 0;
    int unmatched_replies = 0;          // Late duplicates or foreign sequences
    size_t peak_in_flight = 0;
};

/**
 * 32-bit request sequence numbers.
 * Default-constructed generators start from a random value; tests pass a seed.
 */
class SequenceGenerator {
public:
    SequenceGenerator() : seq_(std::random_device{}()) {}
    explicit SequenceGenerator(uint32_t seed) : seq_(seed) {}

    uint32_t next() { return ++seq_; }

private:
    uint32_t seq_;
};

/**
 * One window slot. While in the window it is blank; while in flight it
 * tracks a request awaiting its reply.
 */
struct PendingEntry {
    Message request;
    uint32_t sequence = 0;
    Clock::time_point sent_at{};        // First send or latest resend
    int retry_count = 0;
    bool complete = false;

    void track(const Message& msg, uint32_t seq, Clock::time_point now);
    void recordRetry(Clock::time_point now);
    void invalidate();
};

/**
 * Selective Repeat window for device file transfers
 *
 * Keeps up to window_size chunk requests outstanding and resends each one
 * individually when its reply is late:
 * - send() blocks until a slot is free, then transmits
 * - replies are matched by sequence number on the link's receive thread
 * - flush() blocks until every request has been answered
 * - a request resent min_retries times without a reply fails the transfer
 *
 * Roles: only the calling thread (send/flush) moves slots from the window
 * into the in-flight set; only the link thread (reply handler) moves them
 * back. The one exception is teardown after a failure, which the calling
 * thread performs before throwing.
 *
 * The reply subscription lives exactly as long as this object.
 */
class SelectiveRepeater {
public:
    // Called on the link thread, under the repeater lock, once per answered
    // request. Must not call back into the repeater.
    using ChunkCallback = std::function<void(const Message& request, const Message& reply)>;

    SelectiveRepeater(link::ILink& link, uint16_t reply_type,
                      ChunkCallback on_chunk = nullptr,
                      const RepeaterConfig& config = RepeaterConfig{});
    ~SelectiveRepeater();

    SelectiveRepeater(const SelectiveRepeater&) = delete;
    SelectiveRepeater& operator=(const SelectiveRepeater&) = delete;

    // Wait for a free slot, then transmit. The request must carry a sequence
    // number not already in flight. Throws TransferTimeout or LinkError.
    void send(const Message& request);

    // Wait until nothing is in flight. Throws TransferTimeout or LinkError.
    void flush();

    size_t inFlight() const;
    size_t availableSlots() const;
    bool failed() const;
    RepeaterStats getStats() const;

private:
    link::ILink& link_;
    uint16_t reply_type_;
    ChunkCallback on_chunk_;
    RepeaterConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;        // Signalled when a slot comes back

    std::vector<std::unique_ptr<PendingEntry>> window_;              // Free slots
    std::map<uint32_t, std::unique_ptr<PendingEntry>> pending_;      // In flight, by sequence
    bool failed_ = false;
    RepeaterStats stats_;

    // Last member: unsubscribed before anything the handler touches is destroyed
    std::unique_ptr<link::Subscription> subscription_;

    // Issuing role
    void fetchPendingEntry(const Message& request, uint32_t seq);
    std::vector<Message> checkPending(Clock::time_point now);
    Clock::time_point nextDeadline(Clock::time_point now) const;
    void waitLocked(std::unique_lock<std::mutex>& lock, const std::function<bool()>& ready);
    void teardown();

    // Reply-consuming role
    void onReply(const Message& reply);
    void returnPendingEntry(std::map<uint32_t, std::unique_ptr<PendingEntry>>::iterator it);
};

} // namespace protocol
} // namespace fileio
