#include "engine/record_store.hpp"
#include "engine/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace caserun::engine {

MemoryRecordStore::MemoryRecordStore(size_t retention, const std::string& journal_path)
    : retention_(retention) {
    if (!journal_path.empty()) {
        journal_.open(journal_path, std::ios::app);
        if (!journal_.is_open()) {
            spdlog::warn("Cannot open record journal {}, continuing in memory only", journal_path);
        } else {
            spdlog::info("Record journal: {}", journal_path);
        }
    }
}

void MemoryRecordStore::journal_locked(const char* kind, const nlohmann::json& data) {
    if (!journal_.is_open()) {
        return;
    }
    nlohmann::json line;
    line["kind"] = kind;
    line["at"] = format_timestamp(std::chrono::system_clock::now());
    line["data"] = data;
    journal_ << line.dump() << "\n";
    journal_.flush();
    if (!journal_.good()) {
        spdlog::error("Record journal write failed, closing journal");
        journal_.close();
    }
}

// ============================================================================
// Sessions
// ============================================================================

void MemoryRecordStore::save_session(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    Session stored = session;
    auto it = session_executions_.find(session.id);
    stored.execution_ids = it != session_executions_.end() ? it->second : std::vector<std::string>{};
    sessions_[session.id] = stored;
    journal_locked("session", stored.to_json());
}

std::optional<Session> MemoryRecordStore::load_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    Session session = it->second;
    auto ids = session_executions_.find(id);
    if (ids != session_executions_.end()) {
        session.execution_ids = ids->second;
    }
    return session;
}

std::vector<Session> MemoryRecordStore::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
        auto ids = session_executions_.find(id);
        if (ids != session_executions_.end()) {
            result.back().execution_ids = ids->second;
        }
    }
    return result;
}

// ============================================================================
// Executions
// ============================================================================

void MemoryRecordStore::check_transition_locked(const Execution& current, const Execution& next) const {
    if (is_terminal(current.status)) {
        throw EngineError(ErrorCode::INVALID_TRANSITION,
            "execution " + current.id + " is already " +
            execution_status_to_string(current.status));
    }
    if (current.status != next.status && !is_valid_transition(current.status, next.status)) {
        throw EngineError(ErrorCode::INVALID_TRANSITION,
            std::string("execution ") + current.id + ": " +
            execution_status_to_string(current.status) + " -> " +
            execution_status_to_string(next.status));
    }
}

void MemoryRecordStore::save_execution(const Execution& execution) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(execution.id);
    if (it != executions_.end()) {
        check_transition_locked(it->second, execution);
        it->second = execution;
    } else {
        executions_[execution.id] = execution;
        session_executions_[execution.session_id].push_back(execution.id);
    }

    if (is_terminal(execution.status)) {
        journal_locked("execution", execution.to_json());
        enforce_retention_locked(execution.session_id);
    }
}

std::optional<Execution> MemoryRecordStore::load_execution(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Execution> MemoryRecordStore::update_execution(
    const std::string& id, const std::function<void(Execution&)>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return std::nullopt;
    }

    Execution next = it->second;
    mutator(next);
    check_transition_locked(it->second, next);
    it->second = next;

    if (is_terminal(next.status)) {
        journal_locked("execution", next.to_json());
        enforce_retention_locked(next.session_id);
    }
    return next;
}

void MemoryRecordStore::erase_execution(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return;
    }
    auto& ids = session_executions_[it->second.session_id];
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    executions_.erase(it);
}

std::vector<Execution> MemoryRecordStore::list_executions(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Execution> result;
    auto it = session_executions_.find(session_id);
    if (it == session_executions_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        auto exec = executions_.find(id);
        if (exec != executions_.end()) {
            result.push_back(exec->second);
        }
    }
    return result;
}

void MemoryRecordStore::enforce_retention_locked(const std::string& session_id) {
    if (retention_ == 0) {
        return;
    }
    auto& ids = session_executions_[session_id];

    size_t terminal = 0;
    for (const auto& id : ids) {
        auto it = executions_.find(id);
        if (it != executions_.end() && is_terminal(it->second.status)) {
            terminal++;
        }
    }

    // Evict oldest terminal records first; live ones are never evicted
    for (auto id_it = ids.begin(); terminal > retention_ && id_it != ids.end();) {
        auto it = executions_.find(*id_it);
        if (it != executions_.end() && is_terminal(it->second.status)) {
            spdlog::trace("Evicting execution {} from session {}", *id_it, session_id);
            executions_.erase(it);
            id_it = ids.erase(id_it);
            terminal--;
        } else {
            ++id_it;
        }
    }
}

size_t MemoryRecordStore::execution_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executions_.size();
}

} // namespace caserun::engine
