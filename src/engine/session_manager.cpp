#include "engine/session_manager.hpp"
#include "engine/errors.hpp"
#include <spdlog/spdlog.h>

namespace caserun::engine {

using json = nlohmann::json;

SessionManager::SessionManager(const SessionConfig& config,
                               RecordStore& store,
                               Dispatcher& dispatcher,
                               const ScriptCatalog& catalog,
                               const SyntaxValidator* validator,
                               AuditLogger* audit)
    : config_(config)
    , store_(store)
    , dispatcher_(dispatcher)
    , catalog_(catalog)
    , validator_(validator)
    , audit_(audit)
    , clock_([] { return std::chrono::system_clock::now(); }) {}

void SessionManager::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

TimePoint SessionManager::now() const {
    return clock_();
}

std::shared_ptr<std::mutex> SessionManager::session_lock(const std::string& session_id) {
    auto stored = store_.load_session(session_id);
    if (!stored) {
        throw EngineError(ErrorCode::SESSION_NOT_FOUND, "session not found: " + session_id);
    }
    // A terminal session never changes again, so it is not tracked
    if (is_terminal(stored->status)) {
        return std::make_shared<std::mutex>();
    }

    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& m = locks_[session_id];
    if (!m) {
        m = std::make_shared<std::mutex>();
    }
    return m;
}

size_t SessionManager::lock_count() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return locks_.size();
}

void SessionManager::prune_locks() {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    for (auto it = locks_.begin(); it != locks_.end();) {
        auto stored = store_.load_session(it->first);
        if (!stored || is_terminal(stored->status)) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
}

void SessionManager::audit_session(const char* event, const Session& session, bool success) {
    if (audit_) {
        audit_->log(AuditCategory::SESSION, event, session.id,
            {{"user_id", session.user_id},
             {"case", session.case_ref.to_string()},
             {"status", session_status_to_string(session.status)}},
            success);
    }
}

Session SessionManager::load_locked(const std::string& session_id) {
    auto session = store_.load_session(session_id);
    if (!session) {
        throw EngineError(ErrorCode::SESSION_NOT_FOUND, "session not found: " + session_id);
    }

    if (!is_terminal(session->status) && now() >= session->expires_at) {
        session->status = SessionStatus::EXPIRED;
        store_.save_session(*session);
        spdlog::info("Session {} expired", session->id);
        audit_session("SESSION_EXPIRED", *session);
    }
    return *session;
}

void SessionManager::require_not_terminal(const Session& session) const {
    if (is_terminal(session.status)) {
        throw EngineError(ErrorCode::SESSION_TERMINAL,
            "session " + session.id + " is " + session_status_to_string(session.status));
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Session SessionManager::create(const std::string& user_id,
                               const CaseRef& case_ref,
                               std::optional<SessionQuota> quota) {
    if (user_id.empty()) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "user_id is required");
    }
    if (!is_valid_slug(case_ref.book_slug) || !is_valid_slug(case_ref.case_slug) ||
        (!case_ref.chapter_slug.empty() && !is_valid_slug(case_ref.chapter_slug))) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "invalid case reference: " + case_ref.to_string());
    }

    SessionQuota q = quota.value_or(config_.default_quota);
    if (q.max_concurrent_executions == 0 || q.max_execution_seconds == 0) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "quota values must be positive");
    }

    Session session;
    session.id = generate_id("ses");
    session.user_id = user_id;
    session.case_ref = case_ref;
    session.status = SessionStatus::ACTIVE;
    session.created_at = now();
    session.expires_at = session.created_at + std::chrono::seconds(config_.default_lifetime_seconds);
    session.quota = q;

    auto files = catalog_.load_case(case_ref);
    if (files) {
        session.files.original = std::move(*files);
    } else {
        spdlog::warn("Case {} not found in catalog, session {} starts with no files",
            case_ref.to_string(), session.id);
    }

    store_.save_session(session);

    spdlog::info("Session {} created (user={}, case={}, files={})",
        session.id, user_id, case_ref.to_string(), session.files.original.size());
    audit_session("SESSION_CREATED", session);
    return session;
}

Session SessionManager::get(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    return load_locked(session_id);
}

Session SessionManager::pause(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    Session session = load_locked(session_id);
    require_not_terminal(session);
    if (session.status != SessionStatus::ACTIVE) {
        throw EngineError(ErrorCode::INVALID_TRANSITION,
            "cannot pause a " + std::string(session_status_to_string(session.status)) + " session");
    }

    session.status = SessionStatus::PAUSED;
    store_.save_session(session);
    spdlog::info("Session {} paused", session.id);
    audit_session("SESSION_PAUSED", session);
    return session;
}

Session SessionManager::resume(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    Session session = load_locked(session_id);
    require_not_terminal(session);
    if (session.status != SessionStatus::PAUSED) {
        throw EngineError(ErrorCode::INVALID_TRANSITION,
            "cannot resume a " + std::string(session_status_to_string(session.status)) + " session");
    }

    session.status = SessionStatus::ACTIVE;
    store_.save_session(session);
    spdlog::info("Session {} resumed", session.id);
    audit_session("SESSION_RESUMED", session);
    return session;
}

Session SessionManager::extend(const std::string& session_id, std::chrono::seconds duration) {
    if (duration.count() <= 0) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "extension must be positive");
    }
    if (duration.count() > static_cast<int64_t>(config_.max_extension_seconds)) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT,
            "extension exceeds " + std::to_string(config_.max_extension_seconds) + "s");
    }

    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    Session session = load_locked(session_id);
    require_not_terminal(session);

    session.expires_at += duration;
    store_.save_session(session);
    spdlog::info("Session {} extended by {}s (expires {})",
        session.id, duration.count(), format_timestamp(session.expires_at));
    audit_session("SESSION_EXTENDED", session);
    return session;
}

void SessionManager::cancel_in_flight(const std::string& session_id) {
    for (const auto& exec : store_.list_executions(session_id)) {
        if (is_terminal(exec.status)) {
            continue;
        }
        try {
            dispatcher_.cancel(exec.id);
        } catch (const EngineError& e) {
            // Finished on its own in the meantime
            spdlog::debug("Execution {} not cancelled: {}", exec.id, e.what());
        }
    }
}

Session SessionManager::terminate(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    Session session = load_locked(session_id);
    if (!is_terminal(session.status)) {
        session.status = SessionStatus::TERMINATED;
        store_.save_session(session);
        spdlog::info("Session {} terminated", session.id);
        audit_session("SESSION_TERMINATED", session);
    }

    cancel_in_flight(session_id);
    return session;
}

std::vector<Execution> SessionManager::list_executions(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    load_locked(session_id);
    return store_.list_executions(session_id);
}

// ============================================================================
// Working files
// ============================================================================

WorkingFiles SessionManager::get_files(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    return load_locked(session_id).files;
}

Session SessionManager::update_file(const std::string& session_id,
                                    const std::string& path,
                                    const std::string& content) {
    if (!is_valid_relative_path(path)) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "invalid file path: " + path);
    }

    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    Session session = load_locked(session_id);
    require_not_terminal(session);

    session.files.modified[path] = content;
    store_.save_session(session);
    spdlog::debug("Session {} updated {} ({} bytes)", session.id, path, content.size());
    return session;
}

Session SessionManager::reset_files(const std::string& session_id) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    Session session = load_locked(session_id);
    require_not_terminal(session);

    session.files.modified.clear();
    store_.save_session(session);
    spdlog::debug("Session {} files reset to original", session.id);
    return session;
}

// ============================================================================
// Admission
// ============================================================================

std::string SessionManager::start_execution(const std::string& session_id,
                                            const std::string& script_ref,
                                            const json& parameters,
                                            std::optional<uint32_t> timeout_seconds) {
    auto lock_ptr = session_lock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    try {
        Session session = load_locked(session_id);
        if (session.status != SessionStatus::ACTIVE) {
            throw EngineError(ErrorCode::SESSION_NOT_ACTIVE,
                "session " + session.id + " is " + session_status_to_string(session.status));
        }

        size_t live = 0;
        for (const auto& exec : store_.list_executions(session_id)) {
            if (!is_terminal(exec.status)) {
                live++;
            }
        }
        if (live >= session.quota.max_concurrent_executions) {
            throw EngineError(ErrorCode::CONCURRENCY_LIMIT_EXCEEDED,
                "session " + session.id + " already has " + std::to_string(live) +
                " execution(s) in flight (limit " +
                std::to_string(session.quota.max_concurrent_executions) + ")");
        }

        if (!is_valid_relative_path(script_ref)) {
            throw EngineError(ErrorCode::INVALID_ARGUMENT, "invalid script reference: " + script_ref);
        }
        FileMap files = session.files.effective();
        auto script = files.find(script_ref);
        if (script == files.end()) {
            throw EngineError(ErrorCode::SCRIPT_NOT_FOUND,
                "script " + script_ref + " not found in case " + session.case_ref.to_string());
        }

        if (validator_) {
            auto check = validator_->validate(script_ref, script->second);
            if (!check.ok) {
                throw EngineError(ErrorCode::SYNTAX_ERROR,
                    "syntax error in " + script_ref + ": " + check.diagnostics);
            }
        }

        StartRequest request;
        request.session_id = session_id;
        request.script_ref = script_ref;
        request.parameters = parameters.is_null() ? json::object() : parameters;
        request.files = std::move(files);
        request.timeout_seconds = timeout_seconds;
        request.quota_max_seconds = session.quota.max_execution_seconds;

        return dispatcher_.start(request);
    } catch (const EngineError& e) {
        if (e.error_class() != ErrorClass::CALLER) {
            spdlog::warn("Execution rejected for session {}: {} ({})",
                session_id, e.what(), error_code_to_string(e.code()));
            if (audit_) {
                audit_->log_admission(error_code_to_string(e.code()), session_id,
                    {{"script_ref", script_ref}, {"error", e.what()}});
            }
        }
        throw;
    }
}

size_t SessionManager::sweep_expired() {
    size_t expired = 0;
    auto current = now();
    for (const auto& session : store_.list_sessions()) {
        if (is_terminal(session.status) || current < session.expires_at) {
            continue;
        }
        try {
            auto lock_ptr = session_lock(session.id);
            std::lock_guard<std::mutex> lock(*lock_ptr);
            if (load_locked(session.id).status == SessionStatus::EXPIRED) {
                expired++;
            }
        } catch (const EngineError& e) {
            spdlog::debug("Sweep skipped {}: {}", session.id, e.what());
        }
    }
    if (expired > 0) {
        spdlog::info("Session sweep expired {} sessions", expired);
    }
    prune_locks();
    return expired;
}

} // namespace caserun::engine
