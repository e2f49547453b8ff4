#include "engine/types.hpp"
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace caserun::engine {

using json = nlohmann::json;

std::string format_timestamp(TimePoint tp) {
    if (tp == TimePoint{}) {
        return "";
    }

    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string generate_id(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = rng();
    }

    std::ostringstream oss;
    oss << prefix << '_' << std::hex << std::setfill('0') << std::setw(16) << value;
    return oss.str();
}

// ============================================================================
// Session
// ============================================================================

const char* session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::ACTIVE:     return "active";
        case SessionStatus::PAUSED:     return "paused";
        case SessionStatus::EXPIRED:    return "expired";
        case SessionStatus::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

std::string CaseRef::to_string() const {
    if (chapter_slug.empty()) {
        return book_slug + "/" + case_slug;
    }
    return book_slug + "/" + chapter_slug + "/" + case_slug;
}

FileMap WorkingFiles::effective() const {
    FileMap merged = original;
    for (const auto& [path, content] : modified) {
        merged[path] = content;
    }
    return merged;
}

json Session::to_json(bool include_files) const {
    json j;
    j["session_id"] = id;
    j["user_id"] = user_id;
    j["book_slug"] = case_ref.book_slug;
    j["chapter_slug"] = case_ref.chapter_slug;
    j["case_slug"] = case_ref.case_slug;
    j["status"] = session_status_to_string(status);
    j["created_at"] = format_timestamp(created_at);
    j["expires_at"] = format_timestamp(expires_at);
    j["quota"] = {
        {"max_concurrent_executions", quota.max_concurrent_executions},
        {"max_execution_seconds", quota.max_execution_seconds}
    };
    j["execution_ids"] = execution_ids;

    if (include_files) {
        j["files"] = {
            {"original", files.original},
            {"modified", files.modified}
        };
    } else {
        std::vector<std::string> names;
        for (const auto& [path, _] : files.effective()) {
            names.push_back(path);
        }
        j["file_names"] = names;
    }

    return j;
}

// ============================================================================
// Execution
// ============================================================================

const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::PENDING:   return "pending";
        case ExecutionStatus::RUNNING:   return "running";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::FAILED:    return "failed";
        case ExecutionStatus::TIMEOUT:   return "timeout";
        case ExecutionStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::optional<ExecutionStatus> execution_status_from_string(const std::string& str) {
    if (str == "pending")   return ExecutionStatus::PENDING;
    if (str == "running")   return ExecutionStatus::RUNNING;
    if (str == "completed") return ExecutionStatus::COMPLETED;
    if (str == "failed")    return ExecutionStatus::FAILED;
    if (str == "timeout")   return ExecutionStatus::TIMEOUT;
    if (str == "cancelled") return ExecutionStatus::CANCELLED;
    return std::nullopt;
}

bool is_valid_transition(ExecutionStatus from, ExecutionStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    if (from == ExecutionStatus::PENDING) {
        return to != ExecutionStatus::PENDING;
    }
    // running
    return is_terminal(to);
}

const char* output_stream_to_string(OutputStream stream) {
    return stream == OutputStream::STDERR ? "stderr" : "stdout";
}

json Execution::to_json() const {
    json j;
    j["execution_id"] = id;
    j["session_id"] = session_id;
    j["script_ref"] = script_ref;
    j["parameters"] = parameters;
    j["status"] = execution_status_to_string(status);
    j["timeout_seconds"] = timeout_seconds;
    j["created_at"] = format_timestamp(created_at);
    j["started_at"] = format_timestamp(started_at);
    j["finished_at"] = format_timestamp(finished_at);
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["output_truncated"] = output_truncated;
    j["exit_code"] = exit_code;
    if (!error_message.empty()) {
        j["error_message"] = error_message;
    }
    if (error_class) {
        j["error_class"] = error_class_to_string(*error_class);
    }
    j["usage"] = {
        {"wall_time_ms", usage.wall_time_ms},
        {"cpu_time_ms", usage.cpu_time_ms},
        {"max_rss_kb", usage.max_rss_kb}
    };

    json files = json::array();
    for (const auto& f : result_files) {
        files.push_back({{"name", f.name}, {"path", f.path}, {"type", f.type}, {"size", f.size}});
    }
    j["result_files"] = files;
    j["sandbox_slot"] = sandbox_slot;

    return j;
}

} // namespace caserun::engine
