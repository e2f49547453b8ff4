#include "engine/stream_channel.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace caserun::engine {

const char* stream_event_type_to_string(StreamEventType type) {
    switch (type) {
        case StreamEventType::OUTPUT_CHUNK: return "output_chunk";
        case StreamEventType::STATUS_CHANGE: return "status_change";
        case StreamEventType::TERMINAL: return "terminal";
        default: return "unknown";
    }
}

nlohmann::json StreamEvent::to_json() const {
    nlohmann::json j;
    j["type"] = stream_event_type_to_string(type);
    j["execution_id"] = execution_id;
    j["sequence"] = sequence;

    switch (type) {
        case StreamEventType::OUTPUT_CHUNK:
            j["stream"] = output_stream_to_string(stream);
            j["text"] = text;
            break;
        case StreamEventType::STATUS_CHANGE:
            j["status"] = execution_status_to_string(status);
            break;
        case StreamEventType::TERMINAL:
            j["status"] = execution_status_to_string(status);
            if (final_execution) {
                j["execution"] = final_execution->to_json();
            }
            break;
    }
    return j;
}

// ============================================================================
// StreamSubscription
// ============================================================================

StreamSubscription::StreamSubscription(std::string execution_id, size_t capacity)
    : execution_id_(std::move(execution_id))
    , capacity_(std::max<size_t>(capacity, 1)) {}

void StreamSubscription::push(StreamEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (detached_) {
            return;
        }
        if (event.type != StreamEventType::TERMINAL) {
            while (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped_++;
            }
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void StreamSubscription::detach() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        detached_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

std::optional<StreamEvent> StreamSubscription::pop_locked() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    StreamEvent event = std::move(queue_.front());
    queue_.pop_front();
    if (event.type == StreamEventType::TERMINAL) {
        finished_ = true;
    }
    return event;
}

std::optional<StreamEvent> StreamSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || finished_ || detached_;
    });
    return pop_locked();
}

std::optional<StreamEvent> StreamSubscription::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pop_locked();
}

bool StreamSubscription::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

uint64_t StreamSubscription::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

// ============================================================================
// StreamChannel
// ============================================================================

StreamChannel::StreamChannel(std::string execution_id, size_t subscriber_capacity)
    : execution_id_(std::move(execution_id))
    , subscriber_capacity_(subscriber_capacity) {}

std::shared_ptr<StreamSubscription> StreamChannel::attach() {
    auto sub = std::make_shared<StreamSubscription>(execution_id_, subscriber_capacity_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        StreamEvent event;
        event.type = StreamEventType::TERMINAL;
        event.execution_id = execution_id_;
        event.sequence = next_sequence_ - 1;
        event.status = final_execution_->status;
        event.final_execution = final_execution_;
        sub->push(std::move(event));
        return sub;
    }

    subscribers_.push_back(sub);
    spdlog::trace("Consumer attached to {} ({} total)", execution_id_, subscribers_.size());
    return sub;
}

void StreamChannel::detach(const std::shared_ptr<StreamSubscription>& subscription) {
    if (!subscription) return;
    subscription->detach();

    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(
        std::remove(subscribers_.begin(), subscribers_.end(), subscription),
        subscribers_.end());
}

void StreamChannel::broadcast_locked(StreamEvent event) {
    event.execution_id = execution_id_;
    event.sequence = next_sequence_++;
    for (auto& sub : subscribers_) {
        sub->push(event);
    }
}

void StreamChannel::publish_output(OutputStream stream, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    StreamEvent event;
    event.type = StreamEventType::OUTPUT_CHUNK;
    event.stream = stream;
    event.text = text;
    broadcast_locked(std::move(event));
}

void StreamChannel::publish_status(ExecutionStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    StreamEvent event;
    event.type = StreamEventType::STATUS_CHANGE;
    event.status = status;
    broadcast_locked(std::move(event));
}

void StreamChannel::close(const Execution& final_execution) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    final_execution_ = std::make_shared<const Execution>(final_execution);

    StreamEvent event;
    event.type = StreamEventType::TERMINAL;
    event.status = final_execution.status;
    event.final_execution = final_execution_;
    broadcast_locked(std::move(event));

    closed_ = true;
    subscribers_.clear();
}

bool StreamChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t StreamChannel::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

// ============================================================================
// StreamRegistry
// ============================================================================

StreamRegistry::StreamRegistry(size_t subscriber_capacity)
    : subscriber_capacity_(subscriber_capacity) {}

std::shared_ptr<StreamChannel> StreamRegistry::open(const std::string& execution_id) {
    auto channel = std::make_shared<StreamChannel>(execution_id, subscriber_capacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[execution_id] = channel;
    return channel;
}

std::shared_ptr<StreamChannel> StreamRegistry::find(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(execution_id);
    if (it != channels_.end()) {
        return it->second;
    }
    return nullptr;
}

void StreamRegistry::remove(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(execution_id);
}

size_t StreamRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

} // namespace caserun::engine
