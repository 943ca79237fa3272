#include "sim_device.hpp"
#include "protocol/errors.hpp"
#include "fileio/logging.hpp"
#include <algorithm>

namespace fileio {
namespace sim {

using namespace protocol;

SimDevice::SimDevice(const Config& config, uint32_t seed)
    : config_(config)
    , rng_(seed)
{
    delivery_thread_ = std::thread([this] { deliveryLoop(); });
}

SimDevice::~SimDevice() {
    close();
}

void SimDevice::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
}

void SimDevice::send(const Message& msg) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) {
        throw LinkError("simulated link closed");
    }

    sent_.push_back(msg);
    stats_.requests_received++;

    auto seq = sequenceOf(msg);
    if (seq) {
        auto it = std::find(drop_once_.begin(), drop_once_.end(), *seq);
        if (it != drop_once_.end()) {
            drop_once_.erase(it);
            stats_.requests_dropped++;
            LOG_SIM(DEBUG, "Dropped %s seq=%u (scripted)", msgTypeToString(msg.type), *seq);
            return;
        }
    }

    if (lose()) {
        stats_.requests_dropped++;
        LOG_SIM(DEBUG, "Lost request %s", msgTypeToString(msg.type));
        return;
    }

    if (!config_.respond) {
        return;
    }

    std::vector<Message> replies = responder_ ? responder_(msg) : serve(msg);

    auto now = std::chrono::steady_clock::now();
    for (auto& reply : replies) {
        if (lose()) {
            stats_.replies_dropped++;
            LOG_SIM(DEBUG, "Lost reply %s", msgTypeToString(reply.type));
            continue;
        }

        uint32_t delay = config_.latency_ms;
        if (config_.jitter_ms > 0) {
            delay += static_cast<uint32_t>(uniform_(rng_) * config_.jitter_ms);
        }

        queue_.push(Delivery{now + std::chrono::milliseconds(delay), next_order_++, std::move(reply)});
        stats_.replies_sent++;
    }

    lock.unlock();
    cv_.notify_all();
}

void SimDevice::setResponder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

void SimDevice::hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = true;
}

void SimDevice::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
    }
    cv_.notify_all();
}

void SimDevice::dropOnce(uint32_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_once_.push_back(sequence);
}

void SimDevice::setFile(const std::string& name, const Bytes& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[name] = data;
}

std::optional<Bytes> SimDevice::getFile(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(name);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Message> SimDevice::sentMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

int SimDevice::countSent(uint16_t msg_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(sent_.begin(), sent_.end(),
        [msg_type](const Message& m) { return m.type == msg_type; }));
}

SimDevice::Stats SimDevice::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool SimDevice::lose() {
    return config_.drop_probability > 0.0 && uniform_(rng_) < config_.drop_probability;
}

// ============================================================================
// Emulated file service
// ============================================================================

std::vector<Message> SimDevice::serve(const Message& request) {
    switch (request.type) {
        case MsgType::READ_REQ: {
            auto req = ReadRequest::decode(request);
            if (!req) break;

            ReadReply reply;
            reply.sequence = req->sequence;
            auto it = files_.find(req->filename);
            if (it != files_.end() && req->offset < it->second.size()) {
                const Bytes& file = it->second;
                size_t n = std::min<size_t>(req->chunk_size, file.size() - req->offset);
                reply.contents.assign(file.begin() + req->offset, file.begin() + req->offset + n);
            }
            LOG_SIM(TRACE, "READ '%s' @%u -> %zu bytes",
                    req->filename.c_str(), req->offset, reply.contents.size());
            return {reply.encode()};
        }

        case MsgType::WRITE_REQ: {
            auto req = WriteRequest::decode(request);
            if (!req) break;

            Bytes& file = files_[req->filename];
            size_t end = static_cast<size_t>(req->offset) + req->data.size();
            if (file.size() < end) {
                file.resize(end, 0);
            }
            std::copy(req->data.begin(), req->data.end(), file.begin() + req->offset);

            WriteReply reply;
            reply.sequence = req->sequence;
            LOG_SIM(TRACE, "WRITE '%s' @%u %zu bytes",
                    req->filename.c_str(), req->offset, req->data.size());
            return {reply.encode()};
        }

        case MsgType::READ_DIR_REQ: {
            auto req = ReadDirRequest::decode(request);
            if (!req) break;

            std::string prefix = req->dirname;
            if (prefix == "." || prefix == "/") {
                prefix.clear();
            } else if (!prefix.empty() && prefix.back() != '/') {
                prefix += '/';
            }

            std::vector<std::string> names;
            for (const auto& [name, data] : files_) {
                if (name.compare(0, prefix.size(), prefix) != 0) continue;
                std::string rest = name.substr(prefix.size());
                if (rest.empty() || rest.find('/') != std::string::npos) continue;
                names.push_back(rest);
            }

            ReadDirReply reply;
            reply.sequence = req->sequence;
            const size_t room = config_.max_payload - READ_REPLY_OVERHEAD;
            for (size_t i = req->offset; i < names.size(); i++) {
                if (reply.contents.size() + names[i].size() + 1 > room) break;
                reply.contents.insert(reply.contents.end(), names[i].begin(), names[i].end());
                reply.contents.push_back(0);
            }
            return {reply.encode()};
        }

        case MsgType::REMOVE: {
            auto req = RemoveRequest::decode(request);
            if (req) {
                files_.erase(req->filename);
            }
            return {};
        }

        default:
            break;
    }

    LOG_SIM(WARN, "No service for %s", msgTypeToString(request.type));
    return {};
}

void SimDevice::deliveryLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (queue_.empty() || held_) {
            cv_.wait(lock);
            continue;
        }

        auto due = queue_.top().due;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        Message msg = queue_.top().msg;
        queue_.pop();

        lock.unlock();
        try {
            dispatch(msg);
        } catch (const std::exception& e) {
            LOG_ERROR("SIM", "Handler for %s threw: %s", msgTypeToString(msg.type), e.what());
        }
        lock.lock();
    }
}

} // namespace sim
} // namespace fileio
