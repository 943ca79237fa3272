#pragma once

#include "link/link.hpp"
#include <atomic>
#include <map>
#include <queue>
#include <random>
#include <thread>
#include <vector>

namespace fileio {
namespace sim {

using protocol::Message;

/**
 * Simulated device behind a lossy link
 *
 * Implements the link contract in-process: requests handed to send() are
 * answered by an emulated file service, and the replies are delivered on a
 * separate thread after a configurable latency. Either direction can drop
 * messages, and per-message jitter reorders replies.
 *
 * The file service can be replaced by a custom responder for scripted
 * exchanges; the channel model still applies.
 */
class SimDevice : public link::LinkBase {
public:
    struct Config {
        double drop_probability = 0.0;  // Per message, each direction
        uint32_t latency_ms = 0;        // Fixed one-way reply delay
        uint32_t jitter_ms = 0;         // Extra uniform delay (reorders replies)
        size_t max_payload = MAX_PAYLOAD_SIZE;
        bool respond = true;            // false: a dead device that never answers
    };

    struct Stats {
        int requests_received = 0;
        int requests_dropped = 0;
        int replies_sent = 0;
        int replies_dropped = 0;
    };

    // Produce the replies to one request
    using Responder = std::function<std::vector<Message>(const Message& request)>;

    explicit SimDevice(const Config& config, uint32_t seed = 42);
    SimDevice() : SimDevice(Config{}) {}
    ~SimDevice() override;

    SimDevice(const SimDevice&) = delete;
    SimDevice& operator=(const SimDevice&) = delete;

    // --- Link contract ---

    void send(const Message& msg) override;
    bool isOpen() const override { return running_; }
    void close() override;

    // --- Scripting ---

    void setResponder(Responder responder);

    // While held, replies queue up undelivered
    void hold();
    void release();

    // Drop only the first transmission of these request sequence numbers
    void dropOnce(uint32_t sequence);

    // --- Device file store ---

    void setFile(const std::string& name, const Bytes& data);
    std::optional<Bytes> getFile(const std::string& name) const;

    // --- Inspection ---

    std::vector<Message> sentMessages() const;
    int countSent(uint16_t msg_type) const;
    Stats getStats() const;

private:
    struct Delivery {
        std::chrono::steady_clock::time_point due;
        uint64_t order;
        Message msg;

        bool operator>(const Delivery& other) const {
            if (due != other.due) return due > other.due;
            return order > other.order;
        }
    };

    Config config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Delivery, std::vector<Delivery>, std::greater<Delivery>> queue_;
    uint64_t next_order_ = 0;
    bool held_ = false;

    std::mt19937 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};

    Responder responder_;
    std::map<std::string, Bytes> files_;
    std::vector<uint32_t> drop_once_;
    std::vector<Message> sent_;
    Stats stats_;

    std::atomic<bool> running_{true};
    std::thread delivery_thread_;

    std::vector<Message> serve(const Message& request);     // Needs mutex_
    bool lose();                                            // Needs mutex_
    void deliveryLoop();
};

} // namespace sim
} // namespace fileio
