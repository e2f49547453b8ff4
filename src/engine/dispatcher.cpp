#include "engine/dispatcher.hpp"
#include "engine/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace caserun::engine {

using json = nlohmann::json;

constexpr const char* PARAMS_FILE = "params.json";

const char* result_file_type(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".png" || ext == ".jpg" || ext == ".svg") return "plot";
    if (ext == ".csv" || ext == ".xlsx") return "table";
    if (ext == ".json") return "data";
    if (ext == ".md" || ext == ".txt") return "report";
    if (ext == ".mp4") return "video";
    if (ext == ".gif") return "animation";
    return nullptr;
}

namespace {

// Append up to the cap; returns false once something had to be cut
bool append_capped(std::string& out, const std::string& chunk, size_t cap) {
    if (out.size() >= cap) {
        return chunk.empty();
    }
    size_t room = cap - out.size();
    out.append(chunk, 0, room);
    return chunk.size() <= room;
}

} // namespace

Dispatcher::Dispatcher(const DispatcherConfig& config,
                       runtime::SandboxPool& pool,
                       RecordStore& store,
                       StreamRegistry& streams,
                       AuditLogger* audit)
    : config_(config)
    , pool_(pool)
    , store_(store)
    , streams_(streams)
    , audit_(audit) {
    if (config_.max_timeout_seconds == 0) {
        config_.max_timeout_seconds = 300;
    }
    if (config_.default_timeout_seconds == 0 ||
        config_.default_timeout_seconds > config_.max_timeout_seconds) {
        config_.default_timeout_seconds = std::min<uint32_t>(30, config_.max_timeout_seconds);
    }
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::start_workers() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!workers_.empty()) {
        return;
    }
    stopping_ = false;

    uint32_t count = config_.worker_threads;
    if (count == 0) {
        count = pool_.config().max_sandboxes;
    }
    for (uint32_t i = 0; i < count; ++i) {
        workers_.emplace_back(&Dispatcher::worker_loop, this);
    }
    spdlog::info("Dispatcher started with {} workers", count);
}

void Dispatcher::shutdown() {
    std::vector<std::shared_ptr<Job>> in_flight;
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workers_.empty() && active_.empty()) {
            return;
        }
        stopping_ = true;
        for (const auto& [id, job] : active_) {
            in_flight.push_back(job);
        }
        workers.swap(workers_);
    }

    if (!in_flight.empty()) {
        spdlog::info("Dispatcher shutting down, cancelling {} executions", in_flight.size());
    }
    for (const auto& job : in_flight) {
        std::lock_guard<std::mutex> job_lock(job->mutex);
        job->cancel_requested = true;
        if (!job->exec_finished) {
            job->handle->sandbox().interrupt();
        }
    }

    cv_.notify_all();
    for (auto& t : workers) {
        if (t.joinable()) {
            t.join();
        }
    }
}

uint32_t Dispatcher::effective_timeout(const StartRequest& request) const {
    uint32_t timeout = request.timeout_seconds.value_or(config_.default_timeout_seconds);
    timeout = std::min(timeout, config_.max_timeout_seconds);
    if (request.quota_max_seconds > 0) {
        timeout = std::min(timeout, request.quota_max_seconds);
    }
    return timeout;
}

std::string Dispatcher::start(const StartRequest& request) {
    if (request.timeout_seconds && *request.timeout_seconds == 0) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "timeout must be at least 1 second");
    }
    if (!request.parameters.is_object()) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "parameters must be a JSON object");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || workers_.empty()) {
            throw EngineError(ErrorCode::INFRASTRUCTURE_UNAVAILABLE, "dispatcher is not running");
        }
    }

    Execution record;
    record.id = generate_id("exe");
    record.session_id = request.session_id;
    record.script_ref = request.script_ref;
    record.parameters = request.parameters;
    record.status = ExecutionStatus::PENDING;
    record.timeout_seconds = effective_timeout(request);
    record.created_at = std::chrono::system_clock::now();

    // Channel first, so an attach that sees the record also finds the channel
    auto channel = streams_.open(record.id);
    store_.save_execution(record);

    std::shared_ptr<runtime::SandboxHandle> handle;
    try {
        handle = pool_.acquire();
    } catch (const EngineError& e) {
        store_.erase_execution(record.id);
        streams_.remove(record.id);
        if (audit_) {
            audit_->log(AuditCategory::POOL, "ACQUIRE_FAILED", request.session_id,
                {{"code", error_code_to_string(e.code())}, {"error", e.what()}}, false);
        }
        throw;
    }

    auto job = std::make_shared<Job>();
    job->execution_id = record.id;
    job->script_ref = request.script_ref;
    job->timeout_seconds = record.timeout_seconds;
    job->parameters = request.parameters;
    job->files = request.files;
    job->handle = handle;
    job->channel = channel;

    store_.update_execution(record.id, [&handle](Execution& e) {
        e.sandbox_slot = handle->slot();
    });

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_) {
            active_[record.id] = job;
            queue_.push_back(job);
            accepted = true;
        }
    }
    if (!accepted) {
        pool_.release(handle, false);
        store_.erase_execution(record.id);
        streams_.remove(record.id);
        throw EngineError(ErrorCode::INFRASTRUCTURE_UNAVAILABLE, "dispatcher is shutting down");
    }
    cv_.notify_one();

    spdlog::info("Execution {} accepted (session={}, script={}, timeout={}s, slot={})",
        record.id, request.session_id, request.script_ref, record.timeout_seconds, handle->slot());
    if (audit_) {
        audit_->log(AuditCategory::EXECUTION, "EXECUTION_STARTED", record.id,
            {{"session_id", request.session_id}, {"script_ref", request.script_ref},
             {"timeout_seconds", record.timeout_seconds}});
    }
    return record.id;
}

Execution Dispatcher::status(const std::string& execution_id) const {
    auto record = store_.load_execution(execution_id);
    if (!record) {
        throw EngineError(ErrorCode::EXECUTION_NOT_FOUND, "execution not found: " + execution_id);
    }
    return *record;
}

void Dispatcher::cancel(const std::string& execution_id) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(execution_id);
        if (it != active_.end()) {
            job = it->second;
        }
    }

    if (!job) {
        auto record = store_.load_execution(execution_id);
        if (!record) {
            throw EngineError(ErrorCode::EXECUTION_NOT_FOUND, "execution not found: " + execution_id);
        }
        throw EngineError(ErrorCode::EXECUTION_NOT_CANCELLABLE,
            "execution " + execution_id + " is already " + execution_status_to_string(record->status));
    }

    {
        std::lock_guard<std::mutex> job_lock(job->mutex);
        if (job->exec_finished) {
            throw EngineError(ErrorCode::EXECUTION_NOT_CANCELLABLE,
                "execution " + execution_id + " is finishing");
        }
        job->cancel_requested = true;
        job->handle->sandbox().interrupt();
    }

    spdlog::info("Execution {} cancellation requested", execution_id);
    if (audit_) {
        audit_->log(AuditCategory::EXECUTION, "EXECUTION_CANCEL_REQUESTED", execution_id, json::object());
    }
}

std::shared_ptr<StreamSubscription> Dispatcher::attach(const std::string& execution_id) {
    if (auto channel = streams_.find(execution_id)) {
        return channel->attach();
    }

    auto record = store_.load_execution(execution_id);
    if (!record) {
        throw EngineError(ErrorCode::EXECUTION_NOT_FOUND, "execution not found: " + execution_id);
    }

    // finalize() saves the terminal record before retiring the channel
    if (auto channel = streams_.find(execution_id)) {
        return channel->attach();
    }
    if (!is_terminal(record->status)) {
        throw EngineError(ErrorCode::EXECUTION_NOT_FOUND, "execution not found: " + execution_id);
    }
    StreamChannel closed(execution_id, 1);
    closed.close(*record);
    return closed.attach();
}

void Dispatcher::detach(const std::string& execution_id,
                        const std::shared_ptr<StreamSubscription>& subscription) {
    if (auto channel = streams_.find(execution_id)) {
        channel->detach(subscription);
    }
}

size_t Dispatcher::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

// ============================================================================
// Worker side
// ============================================================================

void Dispatcher::worker_loop() {
    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            job = queue_.front();
            queue_.pop_front();
        }
        run(job);
    }
}

bool Dispatcher::inject(Job& job) {
    auto& sandbox = job.handle->sandbox();
    for (const auto& [path, content] : job.files) {
        if (!sandbox.write_file(path, content)) {
            return false;
        }
    }
    return sandbox.write_file(PARAMS_FILE, job.parameters.dump(2));
}

void Dispatcher::execute(Job& job, Outcome& outcome) {
    auto& sandbox = job.handle->sandbox();

    store_.update_execution(job.execution_id, [](Execution& e) {
        e.status = ExecutionStatus::RUNNING;
        e.started_at = std::chrono::system_clock::now();
    });
    job.channel->publish_status(ExecutionStatus::RUNNING);
    spdlog::debug("Execution {} running in slot {}", job.execution_id, job.handle->slot());

    runtime::ExecRequest request;
    request.argv = config_.interpreter;
    request.argv.push_back(job.script_ref);
    request.argv.push_back(PARAMS_FILE);
    request.env = {
        std::string("CASERUN_PARAMS=") + PARAMS_FILE,
        "CASERUN_EXECUTION_ID=" + job.execution_id,
    };
    request.timeout = std::chrono::seconds(job.timeout_seconds);

    const size_t cap = config_.max_output_bytes;
    const auto snapshot_interval = std::chrono::milliseconds(config_.snapshot_interval_ms);
    auto last_snapshot = std::chrono::steady_clock::now();

    auto on_output = [&](runtime::StreamKind kind, const std::string& chunk) {
        OutputStream stream = kind == runtime::StreamKind::STDOUT ? OutputStream::STDOUT
                                                                   : OutputStream::STDERR;
        std::string& target = stream == OutputStream::STDOUT ? outcome.stdout_text
                                                             : outcome.stderr_text;
        if (!append_capped(target, chunk, cap)) {
            outcome.output_truncated = true;
        }
        job.channel->publish_output(stream, chunk);
        spdlog::trace("Execution {} {} chunk ({} bytes)",
            job.execution_id, output_stream_to_string(stream), chunk.size());

        // Pollers see partial output without a store write per chunk
        auto now = std::chrono::steady_clock::now();
        if (now - last_snapshot >= snapshot_interval) {
            last_snapshot = now;
            store_.update_execution(job.execution_id, [&outcome](Execution& e) {
                e.stdout_text = outcome.stdout_text;
                e.stderr_text = outcome.stderr_text;
                e.output_truncated = outcome.output_truncated;
            });
        }
    };

    auto result = sandbox.exec(request, on_output);
    {
        std::lock_guard<std::mutex> job_lock(job.mutex);
        job.exec_finished = true;
        if (job.cancel_requested) {
            result.interrupted = true;
        }
    }

    outcome.exit_code = result.exit_code;
    outcome.usage.wall_time_ms = result.wall_time_ms;
    outcome.usage.cpu_time_ms = result.cpu_time_ms;
    outcome.usage.max_rss_kb = result.max_rss_kb;
    outcome.strays_killed = result.strays_killed;

    if (result.spawn_failed) {
        outcome.status = ExecutionStatus::FAILED;
        outcome.error_class = ErrorClass::INFRASTRUCTURE;
        outcome.error_message = "sandbox could not start the interpreter";
    } else if (result.interrupted) {
        outcome.status = ExecutionStatus::CANCELLED;
        outcome.error_message = "execution cancelled";
    } else if (result.timed_out) {
        outcome.status = ExecutionStatus::TIMEOUT;
        outcome.error_message = "execution exceeded " + std::to_string(job.timeout_seconds) + "s";
    } else if (result.exit_code == 0) {
        outcome.status = ExecutionStatus::COMPLETED;
        outcome.result_files = collect_result_files(job);
    } else {
        outcome.status = ExecutionStatus::FAILED;
        outcome.error_message = "script exited with code " + std::to_string(result.exit_code);
    }
}

std::vector<ResultFile> Dispatcher::collect_result_files(Job& job) const {
    auto& sandbox = job.handle->sandbox();
    std::vector<ResultFile> files;

    for (const auto& rel : sandbox.list_files()) {
        if (rel == PARAMS_FILE || job.files.count(rel) > 0) {
            continue;  // inputs, not results
        }
        const char* type = result_file_type(rel);
        if (type == nullptr) {
            continue;
        }
        std::error_code ec;
        auto size = fs::file_size(fs::path(sandbox.work_dir()) / rel, ec);
        if (ec) {
            continue;
        }
        ResultFile rf;
        rf.name = fs::path(rel).filename().string();
        rf.path = rel;
        rf.type = type;
        rf.size = size;
        files.push_back(std::move(rf));
    }
    return files;
}

void Dispatcher::run(const std::shared_ptr<Job>& job) {
    Outcome outcome;

    bool cancelled_early;
    {
        std::lock_guard<std::mutex> job_lock(job->mutex);
        cancelled_early = job->cancel_requested;
        if (cancelled_early) {
            job->exec_finished = true;
        }
    }

    if (cancelled_early) {
        outcome.status = ExecutionStatus::CANCELLED;
        outcome.error_message = "execution cancelled before start";
    } else if (!inject(*job)) {
        std::lock_guard<std::mutex> job_lock(job->mutex);
        job->exec_finished = true;
        outcome.status = ExecutionStatus::FAILED;
        outcome.error_class = ErrorClass::INFRASTRUCTURE;
        outcome.error_message = "failed to inject working files into the sandbox";
        spdlog::error("Execution {}: injection into slot {} failed",
            job->execution_id, job->handle->slot());
    } else {
        try {
            execute(*job, outcome);
        } catch (const std::exception& e) {
            // The record must still reach a terminal state
            std::lock_guard<std::mutex> job_lock(job->mutex);
            job->exec_finished = true;
            outcome.status = ExecutionStatus::FAILED;
            outcome.error_class = ErrorClass::INFRASTRUCTURE;
            outcome.error_message = std::string("internal error: ") + e.what();
            spdlog::error("Execution {} aborted: {}", job->execution_id, e.what());
        }
    }

    // Only a clean exit that left nothing running proves the sandbox is fit for reuse
    bool taint = outcome.status != ExecutionStatus::COMPLETED || outcome.strays_killed;
    pool_.release(job->handle, taint);
    if (taint && audit_) {
        audit_->log(AuditCategory::POOL, "SANDBOX_TAINTED", job->execution_id,
            {{"slot", job->handle->slot()}, {"status", execution_status_to_string(outcome.status)},
             {"strays_killed", outcome.strays_killed}});
    }

    finalize(job, outcome);
}

void Dispatcher::finalize(const std::shared_ptr<Job>& job, Outcome& outcome) {
    std::optional<Execution> final_record;
    try {
        final_record = store_.update_execution(job->execution_id, [&outcome](Execution& e) {
            e.status = outcome.status;
            e.finished_at = std::chrono::system_clock::now();
            e.exit_code = outcome.exit_code;
            e.error_message = outcome.error_message;
            e.error_class = outcome.error_class;
            e.stdout_text = std::move(outcome.stdout_text);
            e.stderr_text = std::move(outcome.stderr_text);
            e.output_truncated = outcome.output_truncated;
            e.usage = outcome.usage;
            e.result_files = std::move(outcome.result_files);
        });
    } catch (const EngineError& e) {
        spdlog::error("Execution {} could not be finalized: {}", job->execution_id, e.what());
        final_record = store_.load_execution(job->execution_id);
    }

    if (final_record) {
        job->channel->close(*final_record);
    } else {
        spdlog::error("Execution {} vanished from the record store", job->execution_id);
        Execution placeholder;
        placeholder.id = job->execution_id;
        placeholder.status = outcome.status;
        job->channel->close(placeholder);
    }
    streams_.remove(job->execution_id);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(job->execution_id);
    }

    if (final_record) {
        auto level = final_record->status == ExecutionStatus::COMPLETED ? spdlog::level::info
                                                                         : spdlog::level::warn;
        spdlog::log(level, "Execution {} {} (exit={}, wall={}ms)",
            final_record->id, execution_status_to_string(final_record->status),
            final_record->exit_code, final_record->usage.wall_time_ms);
        if (audit_) {
            audit_->log(AuditCategory::EXECUTION, "EXECUTION_FINISHED", final_record->id,
                {{"session_id", final_record->session_id},
                 {"status", execution_status_to_string(final_record->status)},
                 {"exit_code", final_record->exit_code},
                 {"wall_time_ms", final_record->usage.wall_time_ms}},
                final_record->status == ExecutionStatus::COMPLETED);
        }
    }
}

} // namespace caserun::engine
