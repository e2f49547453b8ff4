/**
 * caserun records
 *
 * Session: one learner's bounded-lifetime unit of work on one case.
 * Execution: one run of one script under one session.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/errors.hpp"

namespace caserun::engine {

using TimePoint = std::chrono::system_clock::time_point;

// ISO 8601 with milliseconds, UTC. Unset time points render as "".
std::string format_timestamp(TimePoint tp);

// Opaque random identifier, e.g. "ses_3f9a0c1d2b4e5f60"
std::string generate_id(const std::string& prefix);

// ============================================================================
// Session
// ============================================================================

enum class SessionStatus {
    ACTIVE,
    PAUSED,
    EXPIRED,
    TERMINATED
};

const char* session_status_to_string(SessionStatus status);

// expired and terminated have no outgoing transitions
inline bool is_terminal(SessionStatus status) {
    return status == SessionStatus::EXPIRED || status == SessionStatus::TERMINATED;
}

struct CaseRef {
    std::string book_slug;
    std::string chapter_slug;   // may be empty
    std::string case_slug;

    std::string to_string() const;
};

struct SessionQuota {
    uint32_t max_concurrent_executions = 1;
    uint32_t max_execution_seconds = 300;
};

using FileMap = std::map<std::string, std::string>;

// Two-slot snapshot: catalog original plus the learner's edits
struct WorkingFiles {
    FileMap original;
    FileMap modified;

    // original overlaid by modified
    FileMap effective() const;
};

struct Session {
    std::string id;
    std::string user_id;
    CaseRef case_ref;
    SessionStatus status = SessionStatus::ACTIVE;
    TimePoint created_at;
    TimePoint expires_at;
    SessionQuota quota;
    WorkingFiles files;
    std::vector<std::string> execution_ids;   // ordered by start time

    nlohmann::json to_json(bool include_files = false) const;
};

// ============================================================================
// Execution
// ============================================================================

enum class ExecutionStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMEOUT,
    CANCELLED
};

const char* execution_status_to_string(ExecutionStatus status);
std::optional<ExecutionStatus> execution_status_from_string(const std::string& str);

inline bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::COMPLETED ||
           status == ExecutionStatus::FAILED ||
           status == ExecutionStatus::TIMEOUT ||
           status == ExecutionStatus::CANCELLED;
}

// pending -> running -> terminal, or pending -> terminal. Nothing leaves a
// terminal status.
bool is_valid_transition(ExecutionStatus from, ExecutionStatus to);

enum class OutputStream {
    STDOUT,
    STDERR
};

const char* output_stream_to_string(OutputStream stream);

struct ResultFile {
    std::string name;
    std::string path;       // relative to the work directory
    std::string type;       // plot, table, data, report, video, animation
    uint64_t size = 0;
};

struct ResourceUsage {
    uint64_t wall_time_ms = 0;
    uint64_t cpu_time_ms = 0;
    uint64_t max_rss_kb = 0;
};

struct Execution {
    std::string id;
    std::string session_id;
    std::string script_ref;
    nlohmann::json parameters = nlohmann::json::object();
    ExecutionStatus status = ExecutionStatus::PENDING;
    uint32_t timeout_seconds = 0;           // the one authoritative deadline

    TimePoint created_at;
    TimePoint started_at;                   // unset until running
    TimePoint finished_at;                  // unset until terminal

    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated = false;
    int exit_code = -1;
    std::string error_message;
    // Set when the platform, not the script, caused the failure
    std::optional<ErrorClass> error_class;

    ResourceUsage usage;
    std::vector<ResultFile> result_files;
    uint32_t sandbox_slot = 0;              // 0 = no sandbox assigned

    nlohmann::json to_json() const;
};

} // namespace caserun::engine
