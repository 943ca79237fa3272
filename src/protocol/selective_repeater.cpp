#include "selective_repeater.hpp"
#include "errors.hpp"
#include "fileio/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace fileio {
namespace protocol {

// ============================================================================
// PendingEntry
// ============================================================================

void PendingEntry::track(const Message& msg, uint32_t seq, Clock::time_point now) {
    request = msg;
    sequence = seq;
    sent_at = now;
    retry_count = 0;
    complete = false;
}

void PendingEntry::recordRetry(Clock::time_point now) {
    retry_count++;
    sent_at = now;
}

void PendingEntry::invalidate() {
    request = Message{};
    sequence = 0;
    sent_at = Clock::time_point{};
    retry_count = 0;
    complete = false;
}

// ============================================================================
// SelectiveRepeater
// ============================================================================

SelectiveRepeater::SelectiveRepeater(link::ILink& link, uint16_t reply_type,
                                     ChunkCallback on_chunk,
                                     const RepeaterConfig& config)
    : link_(link)
    , reply_type_(reply_type)
    , on_chunk_(std::move(on_chunk))
    , config_(config)
{
    if (config_.window_size < 1) {
        config_.window_size = 1;
    }

    window_.reserve(config_.window_size);
    for (size_t i = 0; i < config_.window_size; i++) {
        window_.push_back(std::make_unique<PendingEntry>());
    }

    subscription_ = std::make_unique<link::Subscription>(
        link_, reply_type_, [this](const Message& reply) { onReply(reply); });

    LOG_ARQ(DEBUG, "Repeater up: window=%zu timeout=%ums retries=%d reply=%s",
            config_.window_size, config_.timeout_ms, config_.min_retries,
            msgTypeToString(reply_type_));
}

SelectiveRepeater::~SelectiveRepeater() {
    // Stop replies first; the handler touches everything below
    subscription_.reset();

    LOG_ARQ(DEBUG, "Repeater down: sent=%d resent=%d done=%d unmatched=%d peak=%zu",
            stats_.requests_sent, stats_.retransmissions, stats_.completions,
            stats_.unmatched_replies, stats_.peak_in_flight);
}

void SelectiveRepeater::send(const Message& request) {
    auto seq = sequenceOf(request);
    if (!seq) {
        throw std::invalid_argument(std::string("request without sequence: ") +
                                    msgTypeToString(request.type));
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        waitLocked(lock, [this] { return !window_.empty(); });

        if (pending_.count(*seq) != 0) {
            throw std::invalid_argument("sequence " + std::to_string(*seq) + " already in flight");
        }
        fetchPendingEntry(request, *seq);
    }

    link_.send(request);
}

void SelectiveRepeater::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    waitLocked(lock, [this] { return pending_.empty(); });
    LOG_ARQ(DEBUG, "Flushed (%d completions)", stats_.completions);
}

size_t SelectiveRepeater::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t SelectiveRepeater::availableSlots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

bool SelectiveRepeater::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

RepeaterStats SelectiveRepeater::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// ============================================================================
// Issuing role
// ============================================================================

void SelectiveRepeater::fetchPendingEntry(const Message& request, uint32_t seq) {
    std::unique_ptr<PendingEntry> entry = std::move(window_.back());
    window_.pop_back();

    entry->track(request, seq, Clock::now());
    pending_.emplace(seq, std::move(entry));

    stats_.requests_sent++;
    stats_.peak_in_flight = std::max(stats_.peak_in_flight, pending_.size());

    LOG_ARQ(TRACE, "Sent %s seq=%u, in flight=%zu",
            msgTypeToString(request.type), seq, pending_.size());
}

// Returns the requests to resend. Throws TransferTimeout (after teardown)
// when a request has used up its retries.
std::vector<Message> SelectiveRepeater::checkPending(Clock::time_point now) {
    std::vector<Message> resend;
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);

    for (auto& [seq, entry] : pending_) {
        if (entry->complete) {
            continue;
        }
        if (now - entry->sent_at <= timeout) {
            continue;
        }

        if (entry->retry_count >= config_.min_retries) {
            LOG_ARQ(ERROR, "%s seq=%u unanswered after %d retries",
                    msgTypeToString(entry->request.type), seq, entry->retry_count);
            std::string what = std::string("Timed out waiting for ") +
                               msgTypeToString(reply_type_) + " (seq=" +
                               std::to_string(seq) + ")";
            teardown();
            throw TransferTimeout(what);
        }

        entry->recordRetry(now);
        stats_.retransmissions++;
        LOG_ARQ(DEBUG, "Resending %s seq=%u (retry %d/%d)",
                msgTypeToString(entry->request.type), seq,
                entry->retry_count, config_.min_retries);
        resend.push_back(entry->request);
    }

    return resend;
}

Clock::time_point SelectiveRepeater::nextDeadline(Clock::time_point now) const {
    // Age must strictly exceed the timeout, hence the extra millisecond
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms + 1);
    Clock::time_point deadline = now + std::chrono::milliseconds(config_.link_check_ms);

    for (const auto& [seq, entry] : pending_) {
        if (!entry->complete) {
            deadline = std::min(deadline, entry->sent_at + timeout);
        }
    }
    return deadline;
}

void SelectiveRepeater::waitLocked(std::unique_lock<std::mutex>& lock,
                                   const std::function<bool()>& ready) {
    while (true) {
        if (failed_) {
            throw TransferTimeout("transfer already failed");
        }

        std::vector<Message> resend = checkPending(Clock::now());
        if (!resend.empty()) {
            lock.unlock();
            for (const auto& msg : resend) {
                link_.send(msg);
            }
            lock.lock();
            continue;
        }

        if (ready()) {
            return;
        }

        if (!link_.isOpen()) {
            throw LinkError("link closed with " + std::to_string(pending_.size()) +
                            " requests in flight");
        }

        cv_.wait_until(lock, nextDeadline(Clock::now()));
    }
}

// Abandon everything in flight so the window is whole again. Late replies
// find nothing to match.
void SelectiveRepeater::teardown() {
    failed_ = true;
    for (auto& [seq, entry] : pending_) {
        entry->invalidate();
        window_.push_back(std::move(entry));
    }
    pending_.clear();
    cv_.notify_all();
}

// ============================================================================
// Reply-consuming role
// ============================================================================

void SelectiveRepeater::onReply(const Message& reply) {
    auto seq = sequenceOf(reply);
    if (!seq) {
        LOG_ARQ(WARN, "Dropping %s without sequence", msgTypeToString(reply.type));
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
        return;
    }

    auto it = pending_.find(*seq);
    if (it == pending_.end() || it->second->complete) {
        stats_.unmatched_replies++;
        LOG_ARQ(DEBUG, "Unmatched %s seq=%u", msgTypeToString(reply.type), *seq);
        return;
    }

    if (on_chunk_) {
        on_chunk_(it->second->request, reply);
    }

    it->second->complete = true;
    returnPendingEntry(it);
    stats_.completions++;

    cv_.notify_all();
}

void SelectiveRepeater::returnPendingEntry(
        std::map<uint32_t, std::unique_ptr<PendingEntry>>::iterator it) {
    std::unique_ptr<PendingEntry> entry = std::move(it->second);
    pending_.erase(it);
    entry->invalidate();
    window_.push_back(std::move(entry));
}

} // namespace protocol
} // namespace fileio
