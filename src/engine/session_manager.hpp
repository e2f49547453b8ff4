/**
 * caserun Session Lifecycle Manager
 *
 * Session state machine, lazy expiry and admission control in front of the
 * Dispatcher. Every operation on a session runs under that session's
 * admission lock, so a pause and a concurrent start serialize.
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/audit_log.hpp"
#include "engine/dispatcher.hpp"
#include "engine/record_store.hpp"
#include "engine/script_catalog.hpp"
#include "engine/syntax_validator.hpp"
#include "engine/types.hpp"

namespace caserun::engine {

struct SessionConfig {
    uint32_t default_lifetime_seconds = 3600;
    uint32_t max_extension_seconds = 86400;   // per extend() call
    SessionQuota default_quota;
};

class SessionManager {
public:
    using Clock = std::function<TimePoint()>;

    SessionManager(const SessionConfig& config,
                   RecordStore& store,
                   Dispatcher& dispatcher,
                   const ScriptCatalog& catalog,
                   const SyntaxValidator* validator = nullptr,
                   AuditLogger* audit = nullptr);

    Session create(const std::string& user_id,
                   const CaseRef& case_ref,
                   std::optional<SessionQuota> quota = std::nullopt);
    Session get(const std::string& session_id);

    Session pause(const std::string& session_id);
    Session resume(const std::string& session_id);
    Session extend(const std::string& session_id, std::chrono::seconds duration);
    // Idempotent; cancels anything still running under the session
    Session terminate(const std::string& session_id);

    std::vector<Execution> list_executions(const std::string& session_id);

    // Working files
    WorkingFiles get_files(const std::string& session_id);
    Session update_file(const std::string& session_id,
                        const std::string& path,
                        const std::string& content);
    Session reset_files(const std::string& session_id);

    // Admission: active session, quota, script present, syntax clean.
    // Throws EngineError; returns the execution id.
    std::string start_execution(const std::string& session_id,
                                const std::string& script_ref,
                                const nlohmann::json& parameters,
                                std::optional<uint32_t> timeout_seconds = std::nullopt);

    // Housekeeping only; admission never depends on it. Also forgets the
    // admission locks of sessions that have reached a terminal status.
    size_t sweep_expired();

    // Sessions with a tracked admission lock
    size_t lock_count() const;

    void set_clock(Clock clock);
    TimePoint now() const;

private:
    SessionConfig config_;
    RecordStore& store_;
    Dispatcher& dispatcher_;
    const ScriptCatalog& catalog_;
    const SyntaxValidator* validator_;
    AuditLogger* audit_;
    Clock clock_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;

    // Throws SESSION_NOT_FOUND before anything is tracked for an unknown id
    std::shared_ptr<std::mutex> session_lock(const std::string& session_id);
    void prune_locks();

    // Caller holds the session lock. Throws SESSION_NOT_FOUND; applies
    // lazy expiry.
    Session load_locked(const std::string& session_id);
    void require_not_terminal(const Session& session) const;
    void cancel_in_flight(const std::string& session_id);
    void audit_session(const char* event, const Session& session, bool success = true);
};

} // namespace caserun::engine
