/**
 * caserun Streaming Channel
 *
 * One channel per in-flight execution. The dispatcher is the only producer;
 * any number of consumers attach and receive events from the point of
 * attachment onward. Each consumer has a bounded queue that drops its
 * oldest entries on overflow, so a slow consumer never stalls the producer.
 * The terminal event is never dropped.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/types.hpp"

namespace caserun::engine {

enum class StreamEventType {
    OUTPUT_CHUNK,
    STATUS_CHANGE,
    TERMINAL
};

const char* stream_event_type_to_string(StreamEventType type);

struct StreamEvent {
    StreamEventType type = StreamEventType::OUTPUT_CHUNK;
    std::string execution_id;
    uint64_t sequence = 0;      // producer order, per channel

    // OUTPUT_CHUNK
    OutputStream stream = OutputStream::STDOUT;
    std::string text;

    // STATUS_CHANGE and TERMINAL
    ExecutionStatus status = ExecutionStatus::PENDING;

    // TERMINAL
    std::shared_ptr<const Execution> final_execution;

    nlohmann::json to_json() const;
};

class StreamChannel;

class StreamSubscription {
public:
    StreamSubscription(std::string execution_id, size_t capacity);

    // Blocks up to timeout. Returns nullopt on timeout, or once the terminal
    // event has been consumed, or after detach.
    std::optional<StreamEvent> next(std::chrono::milliseconds timeout);
    std::optional<StreamEvent> try_next();

    // Terminal event has been handed out
    bool finished() const;
    uint64_t dropped() const;
    const std::string& execution_id() const { return execution_id_; }

private:
    friend class StreamChannel;

    void push(StreamEvent event);
    void detach();
    std::optional<StreamEvent> pop_locked();

    std::string execution_id_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent> queue_;
    uint64_t dropped_ = 0;
    bool finished_ = false;
    bool detached_ = false;
};

class StreamChannel {
public:
    StreamChannel(std::string execution_id, size_t subscriber_capacity);

    // After close(), the returned subscription already holds the terminal event
    std::shared_ptr<StreamSubscription> attach();
    void detach(const std::shared_ptr<StreamSubscription>& subscription);

    // Producer side
    void publish_output(OutputStream stream, const std::string& text);
    void publish_status(ExecutionStatus status);
    void close(const Execution& final_execution);

    bool closed() const;
    size_t subscriber_count() const;
    const std::string& execution_id() const { return execution_id_; }

private:
    void broadcast_locked(StreamEvent event);

    std::string execution_id_;
    size_t subscriber_capacity_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<StreamSubscription>> subscribers_;
    uint64_t next_sequence_ = 1;
    bool closed_ = false;
    std::shared_ptr<const Execution> final_execution_;
};

// Channels of executions that have not finished yet
class StreamRegistry {
public:
    explicit StreamRegistry(size_t subscriber_capacity = 1024);

    std::shared_ptr<StreamChannel> open(const std::string& execution_id);
    std::shared_ptr<StreamChannel> find(const std::string& execution_id) const;
    void remove(const std::string& execution_id);
    size_t size() const;
    size_t subscriber_capacity() const { return subscriber_capacity_; }

private:
    size_t subscriber_capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<StreamChannel>> channels_;
};

} // namespace caserun::engine
