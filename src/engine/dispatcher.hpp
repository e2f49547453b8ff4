/**
 * caserun Execution Dispatcher
 *
 * start() records a pending execution, acquires a sandbox and returns the
 * execution id at once. A worker thread then injects the working files and
 * parameters, runs the script under its deadline, relays output to the
 * execution's Streaming Channel, releases the sandbox (tainting it unless
 * the run completed cleanly) and finalizes the record.
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/audit_log.hpp"
#include "engine/record_store.hpp"
#include "engine/stream_channel.hpp"
#include "engine/types.hpp"
#include "runtime/sandbox_pool.hpp"

namespace caserun::engine {

struct DispatcherConfig {
    std::vector<std::string> interpreter = {"python3"};  // script and params.json are appended
    uint32_t default_timeout_seconds = 30;
    uint32_t max_timeout_seconds = 300;                  // system maximum
    size_t max_output_bytes = 1024 * 1024;               // per stream, on the record
    uint32_t snapshot_interval_ms = 250;                 // partial output flush to the record
    uint32_t worker_threads = 0;                         // 0 = one per pooled sandbox
};

struct StartRequest {
    std::string session_id;
    std::string script_ref;
    nlohmann::json parameters = nlohmann::json::object();
    FileMap files;                              // effective working files
    std::optional<uint32_t> timeout_seconds;    // caller override
    uint32_t quota_max_seconds = 0;             // session quota, 0 = none
};

// Maps a result file extension to plot, table, data, report, video or
// animation. Returns nullptr for anything else.
const char* result_file_type(const std::string& path);

class Dispatcher {
public:
    Dispatcher(const DispatcherConfig& config,
               runtime::SandboxPool& pool,
               RecordStore& store,
               StreamRegistry& streams,
               AuditLogger* audit = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start_workers();
    // Cancel everything in flight and join the workers
    void shutdown();

    // Non-blocking. Throws EngineError for POOL_EXHAUSTED,
    // INFRASTRUCTURE_UNAVAILABLE and INVALID_ARGUMENT; no record survives
    // a failed start.
    std::string start(const StartRequest& request);

    // Current, possibly non-terminal snapshot. Throws EXECUTION_NOT_FOUND.
    Execution status(const std::string& execution_id) const;

    // Valid while pending or running. Returns once the kill is issued.
    void cancel(const std::string& execution_id);

    // Events from now on; a finished execution yields its terminal event.
    std::shared_ptr<StreamSubscription> attach(const std::string& execution_id);
    void detach(const std::string& execution_id,
                const std::shared_ptr<StreamSubscription>& subscription);

    uint32_t effective_timeout(const StartRequest& request) const;
    size_t in_flight() const;
    const DispatcherConfig& config() const { return config_; }

private:
    struct Job {
        std::string execution_id;
        std::string script_ref;
        uint32_t timeout_seconds = 0;
        nlohmann::json parameters;
        FileMap files;
        std::shared_ptr<runtime::SandboxHandle> handle;
        std::shared_ptr<StreamChannel> channel;

        std::mutex mutex;
        bool cancel_requested = false;
        bool exec_finished = false;
    };

    struct Outcome {
        ExecutionStatus status = ExecutionStatus::FAILED;
        int exit_code = -1;
        std::string error_message;
        std::optional<ErrorClass> error_class;
        bool strays_killed = false;     // taint even when the script exited 0
        std::string stdout_text;
        std::string stderr_text;
        bool output_truncated = false;
        ResourceUsage usage;
        std::vector<ResultFile> result_files;
    };

    DispatcherConfig config_;
    runtime::SandboxPool& pool_;
    RecordStore& store_;
    StreamRegistry& streams_;
    AuditLogger* audit_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Job>> queue_;
    std::unordered_map<std::string, std::shared_ptr<Job>> active_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;

    void worker_loop();
    void run(const std::shared_ptr<Job>& job);
    bool inject(Job& job);
    void execute(Job& job, Outcome& outcome);
    std::vector<ResultFile> collect_result_files(Job& job) const;
    void finalize(const std::shared_ptr<Job>& job, Outcome& outcome);
};

} // namespace caserun::engine
