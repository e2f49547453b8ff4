#pragma once
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "engine/types.hpp"

namespace caserun::engine {

// Storage collaborator for Session and Execution records.
// Execution status updates are monotonic: a terminal record is immutable and
// an invalid status change throws EngineError(INVALID_TRANSITION).
// Session::execution_ids is maintained by the store; the value passed to
// save_session() is ignored.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual void save_session(const Session& session) = 0;
    virtual std::optional<Session> load_session(const std::string& id) const = 0;
    virtual std::vector<Session> list_sessions() const = 0;

    virtual void save_execution(const Execution& execution) = 0;
    virtual std::optional<Execution> load_execution(const std::string& id) const = 0;

    // Atomic read-modify-write. Returns the updated record, or nullopt when
    // the id is unknown.
    virtual std::optional<Execution> update_execution(
        const std::string& id, const std::function<void(Execution&)>& mutator) = 0;

    // Discard a record that never left pending (admission rolled back)
    virtual void erase_execution(const std::string& id) = 0;

    // Oldest first
    virtual std::vector<Execution> list_executions(const std::string& session_id) const = 0;
};

class MemoryRecordStore : public RecordStore {
public:
    // retention: terminal executions kept per session (0 = unlimited).
    // journal_path: when non-empty, session changes and terminal executions
    // are appended there as JSON lines.
    explicit MemoryRecordStore(size_t retention = 50, const std::string& journal_path = "");

    void save_session(const Session& session) override;
    std::optional<Session> load_session(const std::string& id) const override;
    std::vector<Session> list_sessions() const override;

    void save_execution(const Execution& execution) override;
    std::optional<Execution> load_execution(const std::string& id) const override;
    std::optional<Execution> update_execution(
        const std::string& id, const std::function<void(Execution&)>& mutator) override;
    void erase_execution(const std::string& id) override;
    std::vector<Execution> list_executions(const std::string& session_id) const override;

    size_t execution_count() const;

private:
    size_t retention_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, Execution> executions_;
    std::unordered_map<std::string, std::vector<std::string>> session_executions_;

    std::ofstream journal_;

    void check_transition_locked(const Execution& current, const Execution& next) const;
    void enforce_retention_locked(const std::string& session_id);
    void journal_locked(const char* kind, const nlohmann::json& data);
};

} // namespace caserun::engine
