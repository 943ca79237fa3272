#pragma once

#include "protocol/messages.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace fileio {
namespace link {

using protocol::Message;

// Called on the link's receive thread, once per matching message
using MessageHandler = std::function<void(const Message& msg)>;
using HandlerId = uint64_t;

/**
 * Abstract message link to the device
 *
 * Implementations own a receive thread that delivers incoming messages to
 * the handlers registered for their type. removeCallback() does not return
 * while that handler is running, so a handler never outlives its removal.
 */
class ILink {
public:
    virtual ~ILink() = default;

    // Transmit one message. Throws LinkError if the link is closed or the
    // transport fails.
    virtual void send(const Message& msg) = 0;

    virtual HandlerId addCallback(uint16_t msg_type, MessageHandler handler) = 0;
    virtual void removeCallback(HandlerId id) = 0;

    // Block until a message of msg_type arrives or the timeout elapses.
    // Only messages arriving after the call are seen; use ReplyWaiter to arm
    // the wait before sending the request.
    virtual std::optional<Message> waitFor(uint16_t msg_type,
                                           std::chrono::milliseconds timeout) = 0;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

/**
 * Scoped handler registration: registered on construction, removed on
 * destruction (including during stack unwinding).
 */
class Subscription {
public:
    Subscription(ILink& link, uint16_t msg_type, MessageHandler handler);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

private:
    ILink& link_;
    HandlerId id_;
};

/**
 * Captures messages of one type from the moment it is constructed.
 *
 *   ReplyWaiter waiter(link, MsgType::READ_DIR_RESP);
 *   link.send(request);
 *   auto reply = waiter.wait(1000ms);
 */
class ReplyWaiter {
public:
    ReplyWaiter(ILink& link, uint16_t msg_type);

    // Next captured message, or nullopt after timeout
    std::optional<Message> wait(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> received_;
    Subscription subscription_;    // Last: must go before the queue it fills
};

/**
 * Handler registry shared by the concrete links.
 * Subclasses call dispatch() from their receive thread.
 */
class LinkBase : public ILink {
public:
    HandlerId addCallback(uint16_t msg_type, MessageHandler handler) override;
    void removeCallback(HandlerId id) override;

    std::optional<Message> waitFor(uint16_t msg_type,
                                   std::chrono::milliseconds timeout) override;

protected:
    // Invoke every handler registered for msg.type
    void dispatch(const Message& msg);

private:
    struct Entry {
        uint16_t msg_type;
        MessageHandler handler;
    };

    // Held for the whole dispatch so removal waits for a running handler
    std::mutex handlers_mutex_;
    std::map<HandlerId, Entry> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace link
} // namespace fileio
