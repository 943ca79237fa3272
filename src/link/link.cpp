#include "link.hpp"
#include "fileio/logging.hpp"

namespace fileio {
namespace link {

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(ILink& link, uint16_t msg_type, MessageHandler handler)
    : link_(link)
    , id_(link.addCallback(msg_type, std::move(handler)))
{
}

Subscription::~Subscription() {
    link_.removeCallback(id_);
}

// ============================================================================
// ReplyWaiter
// ============================================================================

ReplyWaiter::ReplyWaiter(ILink& link, uint16_t msg_type)
    : subscription_(link, msg_type, [this](const Message& msg) {
          {
              std::lock_guard<std::mutex> lock(mutex_);
              received_.push_back(msg);
          }
          cv_.notify_one();
      })
{
}

std::optional<Message> ReplyWaiter::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !received_.empty(); })) {
        return std::nullopt;
    }
    Message msg = std::move(received_.front());
    received_.pop_front();
    return msg;
}

// ============================================================================
// LinkBase
// ============================================================================

HandlerId LinkBase::addCallback(uint16_t msg_type, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    HandlerId id = next_id_++;
    handlers_.emplace(id, Entry{msg_type, std::move(handler)});
    LOG_LINK(TRACE, "Added handler %llu for %s",
             static_cast<unsigned long long>(id), protocol::msgTypeToString(msg_type));
    return id;
}

void LinkBase::removeCallback(HandlerId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(id);
    LOG_LINK(TRACE, "Removed handler %llu", static_cast<unsigned long long>(id));
}

std::optional<Message> LinkBase::waitFor(uint16_t msg_type,
                                         std::chrono::milliseconds timeout) {
    ReplyWaiter waiter(*this, msg_type);
    return waiter.wait(timeout);
}

void LinkBase::dispatch(const Message& msg) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for (auto& [id, entry] : handlers_) {
        if (entry.msg_type == msg.type) {
            entry.handler(msg);
        }
    }
}

} // namespace link
} // namespace fileio
