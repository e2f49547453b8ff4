/**
 * caserun Sandbox
 *
 * One isolated execution environment: a private work directory, an optional
 * cgroup v2 group for resource limits (memory, CPU, PIDs), and per-run
 * process isolation using Linux namespaces (PID, NET, MNT, UTS).
 * Requires root/CAP_SYS_ADMIN for full isolation; degrades to fork() and
 * rlimits otherwise.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace caserun::runtime {

// Resource limits for sandboxed processes
struct ResourceLimits {
    uint64_t memory_limit_bytes = 1024ULL * 1024 * 1024;  // 1GB default
    uint64_t cpu_shares = 1024;                           // Relative CPU weight
    uint64_t cpu_quota_us = 200000;                       // 2 CPUs worth per period
    uint64_t cpu_period_us = 100000;                      // 100ms period
    uint64_t max_pids = 64;                               // Max processes
    uint64_t max_file_size_bytes = 64ULL * 1024 * 1024;   // Largest file a script may write
};

// Sandbox configuration
struct SandboxConfig {
    std::string name;                                 // Unique sandbox name
    std::string root_path = "/tmp/caserun";           // Parent of the sandbox directory
    std::string cgroup_root = "/sys/fs/cgroup/caserun";
    ResourceLimits limits;

    bool enable_network = false;         // Network isolation
    bool enable_pid_namespace = true;    // PID namespace isolation
    bool enable_mount_namespace = true;  // Mount namespace isolation
    bool enable_uts_namespace = true;    // UTS (hostname) isolation
    bool enable_cgroups = true;          // cgroups resource limits
};

enum class SandboxState {
    CREATED,     // constructed, nothing on disk yet
    READY,       // work directory exists, idle
    RUNNING,     // a process group is executing
    FAILED,
    DESTROYED
};

const char* sandbox_state_to_string(SandboxState state);

// Isolation status - tracks what isolation features are actually active
struct IsolationStatus {
    // Namespace isolation
    bool pid_namespace = false;
    bool net_namespace = false;
    bool mnt_namespace = false;
    bool uts_namespace = false;

    // Cgroup resource limits
    bool cgroups_available = false;
    bool memory_limit_applied = false;
    bool cpu_quota_applied = false;
    bool pids_limit_applied = false;

    bool fully_isolated = false;  // All requested features active
    std::string degraded_reason;  // Why isolation is degraded (if applicable)

    bool is_degraded() const { return !fully_isolated && !degraded_reason.empty(); }
};

enum class StreamKind {
    STDOUT,
    STDERR
};

// One command run inside the sandbox work directory
struct ExecRequest {
    std::vector<std::string> argv;           // argv[0] is looked up on PATH
    std::vector<std::string> env;            // extra "KEY=VALUE" entries
    std::chrono::milliseconds timeout{30000};
};

struct ExecResult {
    int exit_code = -1;          // 128 + signal when killed by a signal
    bool timed_out = false;      // deadline crossed, process group killed
    bool interrupted = false;    // interrupt() killed the process group
    bool spawn_failed = false;   // nothing was started
    bool strays_killed = false;  // processes outlived the main one and were killed
    uint64_t wall_time_ms = 0;
    uint64_t cpu_time_ms = 0;
    uint64_t max_rss_kb = 0;
};

// Called on the exec() thread for every chunk read, in read order
using OutputCallback = std::function<void(StreamKind stream, const std::string& chunk)>;

class Sandbox {
public:
    explicit Sandbox(const SandboxConfig& config);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Lifecycle
    bool create();
    bool reset();
    bool destroy();

    // Run a command to completion, timeout, or interrupt. Blocks the caller.
    ExecResult exec(const ExecRequest& request, const OutputCallback& on_output);

    // Kill the running process group, if any. Safe from any thread; an
    // interrupt issued before exec() spawns makes that exec() a no-op.
    void interrupt();

    // Work directory content
    bool write_file(const std::string& relative_path, const std::string& content);
    std::vector<std::string> list_files() const;

    // Status
    SandboxState state() const { return state_; }
    pid_t pid() const { return current_pgid_.load(); }
    const std::string& name() const { return config_.name; }
    const std::string& work_dir() const { return work_dir_; }
    const SandboxConfig& config() const { return config_; }
    const IsolationStatus& isolation_status() const { return isolation_status_; }

private:
    SandboxConfig config_;
    std::atomic<SandboxState> state_{SandboxState::CREATED};
    IsolationStatus isolation_status_;
    bool degraded_logged_ = false;
    bool cgroup_assigned_ = false;   // last spawn joined the cgroup

    std::string base_dir_;
    std::string work_dir_;
    std::string cgroup_path_;

    // Process group of the running command, -1 when idle
    std::atomic<pid_t> current_pgid_{-1};
    std::atomic<bool> interrupt_requested_{false};
    std::mutex exec_mutex_;

    bool setup_cgroups();
    bool cleanup_cgroups();
    void kill_cgroup();
    bool cgroup_populated() const;
    bool assign_to_cgroup(pid_t pid);

    // Start the child; returns its pid or -1
    pid_t spawn(const ExecRequest& request, int stdout_fd, int stderr_fd, int sync_fd[2]);
    void kill_group(pid_t pgid);

    static int child_entry(void* arg);

    void set_state(SandboxState new_state);
};

} // namespace caserun::runtime
