/**
 * caserun Audit Log
 *
 * Bounded in-memory record of session, execution, pool and admission
 * events. Queryable by category, subject and id cursor; exportable as JSONL.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace caserun::engine {

enum class AuditCategory {
    SESSION,     // create, pause, resume, extend, expire, terminate
    EXECUTION,   // start, finish, cancel
    POOL,        // sandbox creation failures, taints
    ADMISSION    // rejected start requests
};

const char* audit_category_to_string(AuditCategory cat);
std::optional<AuditCategory> audit_category_from_string(const std::string& str);

struct AuditLogEntry {
    uint64_t id;
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category;
    std::string event_type;          // e.g. "SESSION_CREATED", "EXECUTION_FINISHED"
    std::string subject;             // session or execution id, empty for pool events
    nlohmann::json details;
    bool success;

    nlohmann::json to_json() const;
    std::string to_jsonl() const;
};

struct AuditConfig {
    size_t max_entries = 10000;
    bool log_session = true;
    bool log_execution = true;
    bool log_pool = true;
    bool log_admission = true;

    bool is_enabled(AuditCategory cat) const;
};

class AuditLogger {
public:
    AuditLogger();
    explicit AuditLogger(const AuditConfig& config);

    void log(AuditCategory category,
             const std::string& event_type,
             const std::string& subject,
             const nlohmann::json& details,
             bool success = true);

    // Rejections are always recorded with success=false
    void log_admission(const std::string& event_type,
                       const std::string& subject,
                       const nlohmann::json& details);

    // Chronological, newest `limit` entries after since_id
    std::vector<AuditLogEntry> get_entries(
        std::optional<AuditCategory> category = std::nullopt,
        const std::string& subject = "",
        uint64_t since_id = 0,
        size_t limit = 100) const;

    std::string export_jsonl(size_t limit = 0) const;  // 0 = all entries

    void set_config(const AuditConfig& config);
    const AuditConfig& get_config() const { return config_; }

    void clear();
    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    void trim_entries();
};

} // namespace caserun::engine
