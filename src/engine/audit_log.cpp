#include "engine/audit_log.hpp"
#include "engine/types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace caserun::engine {

using json = nlohmann::json;

const char* audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::SESSION:   return "SESSION";
        case AuditCategory::EXECUTION: return "EXECUTION";
        case AuditCategory::POOL:      return "POOL";
        case AuditCategory::ADMISSION: return "ADMISSION";
        default: return "UNKNOWN";
    }
}

std::optional<AuditCategory> audit_category_from_string(const std::string& str) {
    if (str == "SESSION")   return AuditCategory::SESSION;
    if (str == "EXECUTION") return AuditCategory::EXECUTION;
    if (str == "POOL")      return AuditCategory::POOL;
    if (str == "ADMISSION") return AuditCategory::ADMISSION;
    return std::nullopt;
}

// ============================================================================
// AuditLogEntry Implementation
// ============================================================================

json AuditLogEntry::to_json() const {
    json j;
    j["id"] = id;
    j["timestamp"] = format_timestamp(timestamp);
    j["category"] = audit_category_to_string(category);
    j["event_type"] = event_type;
    if (!subject.empty()) {
        j["subject"] = subject;
    }
    j["success"] = success;
    j["details"] = details;
    return j;
}

std::string AuditLogEntry::to_jsonl() const {
    return to_json().dump() + "\n";
}

bool AuditConfig::is_enabled(AuditCategory cat) const {
    switch (cat) {
        case AuditCategory::SESSION:   return log_session;
        case AuditCategory::EXECUTION: return log_execution;
        case AuditCategory::POOL:      return log_pool;
        case AuditCategory::ADMISSION: return log_admission;
        default: return false;
    }
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger() : config_() {}

AuditLogger::AuditLogger(const AuditConfig& config) : config_(config) {
    spdlog::debug("AuditLogger initialized (max_entries={})", config_.max_entries);
}

void AuditLogger::log(AuditCategory category,
                      const std::string& event_type,
                      const std::string& subject,
                      const json& details,
                      bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.is_enabled(category)) {
        return;
    }

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.subject = subject;
    entry.details = details;
    entry.success = success;

    entries_.push_back(std::move(entry));
    trim_entries();

    spdlog::trace("Audit[{}]: {} {} success={}",
                  audit_category_to_string(category), event_type, subject, success);
}

void AuditLogger::log_admission(const std::string& event_type,
                                const std::string& subject,
                                const json& details) {
    log(AuditCategory::ADMISSION, event_type, subject, details, false);
}

std::vector<AuditLogEntry> AuditLogger::get_entries(
    std::optional<AuditCategory> category,
    const std::string& subject,
    uint64_t since_id,
    size_t limit) const {

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        if (it->id <= since_id) {
            break;
        }
        if (category && it->category != *category) {
            continue;
        }
        if (!subject.empty() && it->subject != subject) {
            continue;
        }
        result.push_back(*it);
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::string AuditLogger::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_jsonl();
        count++;
    }
    return oss.str();
}

void AuditLogger::set_config(const AuditConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    trim_entries();
}

void AuditLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace caserun::engine
