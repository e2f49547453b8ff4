#include "util/config.hpp"
#include "engine/errors.hpp"
#include <spdlog/spdlog.h>

#include <climits>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace caserun::util {

using json = nlohmann::json;
using engine::EngineError;
using engine::ErrorCode;

Config::Config() {
    sandbox.name = "sbx";
    sandbox.root_path = "/tmp/caserun";
}

namespace {

[[noreturn]] void config_error(const std::string& message) {
    throw EngineError(ErrorCode::CONFIG_ERROR, "config: " + message);
}

const json* section(const json& doc, const char* name) {
    auto it = doc.find(name);
    if (it == doc.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        config_error(std::string("section '") + name + "' must be an object");
    }
    return &*it;
}

// Overwrite `out` when `key` is present; type mismatches are config errors
template <typename T>
void read(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        config_error(std::string("bad value for '") + key + "': " + e.what());
    }
}

void read_string_list(const json& obj, const char* key, std::vector<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    if (!it->is_array()) {
        config_error(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            config_error(std::string("'") + key + "' must be an array of strings");
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
}

uint32_t parse_env_uint(const char* name, const char* value) {
    char* end = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || parsed > UINT32_MAX) {
        config_error(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    return static_cast<uint32_t>(parsed);
}

void validate(const Config& config) {
    if (config.server.socket_path.empty()) {
        config_error("server.socket_path must not be empty");
    }
    if (config.sandbox.root_path.empty()) {
        config_error("sandbox.work_root must not be empty");
    }
    if (config.pool.max_sandboxes == 0) {
        config_error("pool.max_sandboxes must be at least 1");
    }
    if (config.pool.warm_target > config.pool.max_sandboxes) {
        config_error("pool.warm_target exceeds pool.max_sandboxes");
    }
    if (config.pool.max_reuse == 0) {
        config_error("pool.max_reuse must be at least 1");
    }
    if (config.execution.interpreter.empty()) {
        config_error("execution.interpreter must not be empty");
    }
    if (config.execution.max_timeout_seconds == 0 ||
        config.execution.default_timeout_seconds == 0 ||
        config.execution.default_timeout_seconds > config.execution.max_timeout_seconds) {
        config_error("execution timeouts must satisfy 0 < default_timeout_seconds <= max_timeout_seconds");
    }
    if (config.session.default_quota.max_concurrent_executions == 0 ||
        config.session.default_quota.max_execution_seconds == 0) {
        config_error("session quota values must be positive");
    }
    if (config.session.default_lifetime_seconds == 0) {
        config_error("session.default_lifetime_seconds must be positive");
    }
}

} // namespace

// ============================================================================
// JSON
// ============================================================================

Config parse_config(const json& doc) {
    if (!doc.is_object()) {
        config_error("top level must be an object");
    }

    Config config;

    if (auto s = section(doc, "server")) {
        read(*s, "socket_path", config.server.socket_path);
        read(*s, "log_level", config.server.log_level);
        read(*s, "audit_max_entries", config.server.audit_max_entries);
        read(*s, "journal_path", config.server.journal_path);
    }

    if (auto s = section(doc, "sandbox")) {
        auto& sb = config.sandbox;
        read(*s, "work_root", sb.root_path);
        read(*s, "cgroup_root", sb.cgroup_root);
        read(*s, "name_prefix", sb.name);
        read(*s, "enable_network", sb.enable_network);
        read(*s, "enable_pid_namespace", sb.enable_pid_namespace);
        read(*s, "enable_mount_namespace", sb.enable_mount_namespace);
        read(*s, "enable_uts_namespace", sb.enable_uts_namespace);
        read(*s, "enable_cgroups", sb.enable_cgroups);

        uint64_t memory_mb = sb.limits.memory_limit_bytes / (1024 * 1024);
        read(*s, "memory_limit_mb", memory_mb);
        sb.limits.memory_limit_bytes = memory_mb * 1024 * 1024;

        uint64_t file_mb = sb.limits.max_file_size_bytes / (1024 * 1024);
        read(*s, "max_file_size_mb", file_mb);
        sb.limits.max_file_size_bytes = file_mb * 1024 * 1024;

        read(*s, "cpu_shares", sb.limits.cpu_shares);
        read(*s, "cpu_quota_us", sb.limits.cpu_quota_us);
        read(*s, "cpu_period_us", sb.limits.cpu_period_us);
        read(*s, "max_pids", sb.limits.max_pids);
    }

    if (auto s = section(doc, "pool")) {
        read(*s, "warm_target", config.pool.warm_target);
        read(*s, "max_sandboxes", config.pool.max_sandboxes);
        read(*s, "max_reuse", config.pool.max_reuse);
        read(*s, "replenish_interval_ms", config.pool.replenish_interval_ms);
        read(*s, "retry_after_ms", config.pool.retry_after_ms);
    }

    if (auto s = section(doc, "execution")) {
        auto& ex = config.execution;
        read_string_list(*s, "interpreter", ex.interpreter);
        read(*s, "default_timeout_seconds", ex.default_timeout_seconds);
        read(*s, "max_timeout_seconds", ex.max_timeout_seconds);
        read(*s, "max_output_bytes", ex.max_output_bytes);
        read(*s, "snapshot_interval_ms", ex.snapshot_interval_ms);
        read(*s, "worker_threads", ex.worker_threads);
        read(*s, "stream_buffer_events", config.stream_buffer_events);
        read(*s, "retention", config.retention);
    }

    if (auto s = section(doc, "session")) {
        auto& se = config.session;
        read(*s, "default_lifetime_seconds", se.default_lifetime_seconds);
        read(*s, "max_extension_seconds", se.max_extension_seconds);
        read(*s, "max_concurrent_executions", se.default_quota.max_concurrent_executions);
        read(*s, "max_execution_seconds", se.default_quota.max_execution_seconds);
    }

    if (auto s = section(doc, "catalog")) {
        read(*s, "root", config.catalog_root);
    }

    if (auto s = section(doc, "validator")) {
        auto& v = config.validator;
        read(*s, "enabled", v.enabled);
        read_string_list(*s, "command", v.command);
        read_string_list(*s, "extensions", v.extensions);
        read(*s, "timeout_ms", v.timeout_ms);
    }

    validate(config);
    return config;
}

Config load_config(const std::string& path) {
    load_dotenv();

    Config config;
    if (!path.empty()) {
        std::ifstream in(path);
        if (!in.is_open()) {
            config_error("cannot open " + path);
        }
        json doc;
        try {
            in >> doc;
        } catch (const json::parse_error& e) {
            config_error(path + ": " + e.what());
        }
        config = parse_config(doc);
        spdlog::debug("Loaded configuration from {}", path);
    }

    apply_env_overrides(config);
    validate(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (const char* v = std::getenv("CASERUN_SOCKET")) {
        config.server.socket_path = v;
    }
    if (const char* v = std::getenv("CASERUN_LOG_LEVEL")) {
        config.server.log_level = v;
    }
    if (const char* v = std::getenv("CASERUN_WORK_ROOT")) {
        config.sandbox.root_path = v;
    }
    if (const char* v = std::getenv("CASERUN_CATALOG_ROOT")) {
        config.catalog_root = v;
    }
    if (const char* v = std::getenv("CASERUN_POOL_WARM")) {
        config.pool.warm_target = parse_env_uint("CASERUN_POOL_WARM", v);
    }
    if (const char* v = std::getenv("CASERUN_POOL_MAX")) {
        config.pool.max_sandboxes = parse_env_uint("CASERUN_POOL_MAX", v);
    }
}

// ============================================================================
// .env
// ============================================================================

void load_dotenv_file(const fs::path& env_path) {
    std::ifstream file(env_path);
    if (!file.is_open()) {
        spdlog::warn("Cannot read {}", env_path.string());
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        // Comments
        if (line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = line.substr(7);
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        size_t key_end = key.find_last_not_of(" \t");
        if (key_end != std::string::npos) key = key.substr(0, key_end + 1);

        start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        size_t val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) value = value.substr(0, val_end + 1);

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Variables already in the environment win
        if (!key.empty() && !value.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
    spdlog::debug("Loaded environment from {}", env_path.string());
}

void load_dotenv() {
    std::error_code ec;
    std::vector<fs::path> search_paths = {
        fs::current_path(ec) / ".env",
        "../.env",
    };

    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = fs::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        if (fs::is_regular_file(env_path, ec)) {
            load_dotenv_file(env_path);
            return;
        }
    }
}

} // namespace caserun::util
