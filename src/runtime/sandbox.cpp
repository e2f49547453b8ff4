#include "runtime/sandbox.hpp"
#include "util/which.hpp"
#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sched.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace caserun::runtime {

// Stack size for clone()
constexpr size_t STACK_SIZE = 1024 * 1024; // 1MB

// Poll slice for the output loop; bounds deadline and interrupt latency
constexpr int POLL_SLICE_MS = 20;

// How long to keep reading buffered output after the main process exits
// before closing pipes that something outside the group still holds
constexpr auto DRAIN_GRACE = std::chrono::milliseconds(500);

constexpr size_t READ_CHUNK = 4096;

// Everything the child needs, prepared by the parent before clone()/fork()
// so the child only makes async-signal-safe calls.
struct ChildArgs {
    const char* path;
    char* const* argv;
    char* const* envp;
    const char* work_dir;
    const char* hostname;
    int stdout_fd;
    int stderr_fd;
    int sync_fd[2];
    bool private_mounts;
    bool mount_proc;
    rlim_t cpu_seconds;
    rlim_t address_space_bytes;  // 0 = leave unlimited
    rlim_t file_size_bytes;
};

namespace {

void write_all(int fd, const char* msg) {
    size_t len = strlen(msg);
    while (len > 0) {
        ssize_t n = write(fd, msg, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        msg += n;
        len -= static_cast<size_t>(n);
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Relative, non-empty, and no ".." component
bool is_safe_relative(const fs::path& p) {
    if (p.empty() || p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED: return "created";
        case SandboxState::READY: return "ready";
        case SandboxState::RUNNING: return "running";
        case SandboxState::FAILED: return "failed";
        case SandboxState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(const SandboxConfig& config)
    : config_(config) {
    base_dir_ = config_.root_path + "/" + config_.name;
    work_dir_ = base_dir_ + "/work";
    cgroup_path_ = config_.cgroup_root + "/" + config_.name;
}

Sandbox::~Sandbox() {
    if (state_ != SandboxState::CREATED && state_ != SandboxState::DESTROYED) {
        destroy();
    }
}

bool Sandbox::create() {
    if (state_ != SandboxState::CREATED) {
        spdlog::error("Sandbox {} already created", config_.name);
        return false;
    }

    spdlog::debug("Creating sandbox: {}", config_.name);

    std::error_code ec;
    fs::create_directories(work_dir_, ec);
    if (ec) {
        spdlog::error("Failed to create work directory {}: {}", work_dir_, ec.message());
        set_state(SandboxState::FAILED);
        return false;
    }

    // Setup cgroups if enabled
    if (config_.enable_cgroups) {
        if (!setup_cgroups()) {
            spdlog::error("Failed to setup cgroups for {}", config_.name);
            set_state(SandboxState::FAILED);
            return false;
        }
    }

    set_state(SandboxState::READY);
    spdlog::debug("Sandbox {} created at {}", config_.name, work_dir_);
    return true;
}

bool Sandbox::setup_cgroups() {
    // Check if cgroup v2 is available
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers")) {
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - resource limits will NOT be enforced");
        isolation_status_.degraded_reason = "cgroup v2 not available";
        return true;
    }

    isolation_status_.cgroups_available = true;

    std::error_code ec;
    fs::create_directories(cgroup_path_, ec);
    if (ec) {
        spdlog::warn("DEGRADED ISOLATION: Cannot create sandbox cgroup (need root): {}", ec.message());
        spdlog::warn("  -> Memory limits, CPU quotas, and PID limits fall back to rlimits");
        isolation_status_.degraded_reason = "Cannot create sandbox cgroup (need root)";
        return true; // Continue without cgroups
    }

    auto write_control = [this](const std::string& file, const std::string& value) {
        std::string path = cgroup_path_ + "/" + file;
        if (!fs::exists(path)) {
            spdlog::warn("DEGRADED ISOLATION: {} not available - limit NOT enforced", file);
            return false;
        }
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            spdlog::warn("DEGRADED ISOLATION: Cannot open {}", path);
            return false;
        }
        ofs << value;
        ofs.flush();
        if (!ofs.good()) {
            spdlog::warn("DEGRADED ISOLATION: Failed to write {}", file);
            return false;
        }
        spdlog::debug("Set {} = {}", file, value);
        return true;
    };

    const auto& limits = config_.limits;
    isolation_status_.memory_limit_applied =
        write_control("memory.max", std::to_string(limits.memory_limit_bytes));
    isolation_status_.cpu_quota_applied =
        write_control("cpu.max", std::to_string(limits.cpu_quota_us) + " " +
                                 std::to_string(limits.cpu_period_us));
    isolation_status_.pids_limit_applied =
        write_control("pids.max", std::to_string(limits.max_pids));

    // cpu.weight range: 1-10000 (default 100), shares default 1024
    uint64_t weight = (limits.cpu_shares * 100) / 1024;
    if (weight < 1) weight = 1;
    if (weight > 10000) weight = 10000;
    if (fs::exists(cgroup_path_ + "/cpu.weight") &&
        !write_control("cpu.weight", std::to_string(weight))) {
        spdlog::debug("Could not set CPU weight for {}", config_.name);
    }

    if (!isolation_status_.memory_limit_applied ||
        !isolation_status_.cpu_quota_applied ||
        !isolation_status_.pids_limit_applied) {
        spdlog::warn("Sandbox {} has partial cgroup limits: memory={}, cpu={}, pids={}",
            config_.name,
            isolation_status_.memory_limit_applied ? "ON" : "OFF",
            isolation_status_.cpu_quota_applied ? "ON" : "OFF",
            isolation_status_.pids_limit_applied ? "ON" : "OFF");
    }

    return true;
}

void Sandbox::kill_cgroup() {
    std::string kill_file = cgroup_path_ + "/cgroup.kill";
    if (!fs::exists(kill_file)) {
        return;
    }
    std::ofstream ofs(kill_file);
    ofs << "1";
    ofs.flush();
    if (!ofs.good()) {
        spdlog::debug("Could not write {}", kill_file);
    }
}

bool Sandbox::cgroup_populated() const {
    std::ifstream procs(cgroup_path_ + "/cgroup.procs");
    std::string line;
    while (std::getline(procs, line)) {
        if (!line.empty()) {
            return true;
        }
    }
    return false;
}

bool Sandbox::cleanup_cgroups() {
    if (!config_.enable_cgroups || !fs::exists(cgroup_path_)) {
        return true;
    }

    // A populated cgroup cannot be removed
    kill_cgroup();

    // cgroup directories are removed with rmdir, not recursively
    if (rmdir(cgroup_path_.c_str()) < 0) {
        spdlog::warn("Failed to cleanup cgroup {}: {}", cgroup_path_, strerror(errno));
        return false;
    }
    spdlog::debug("Cleaned up cgroup: {}", cgroup_path_);
    return true;
}

bool Sandbox::assign_to_cgroup(pid_t pid) {
    std::string procs = cgroup_path_ + "/cgroup.procs";
    if (!fs::exists(procs)) {
        return false;
    }
    std::ofstream ofs(procs);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << pid;
    ofs.flush();
    if (!ofs.good()) {
        return false;
    }
    spdlog::trace("Added PID {} to cgroup {}", pid, cgroup_path_);
    return true;
}

int Sandbox::child_entry(void* arg) {
    ChildArgs* args = static_cast<ChildArgs*>(arg);

    // Wait for parent to place us in the cgroup and process group
    close(args->sync_fd[1]);
    char buf;
    while (read(args->sync_fd[0], &buf, 1) < 0 && errno == EINTR) {
    }
    close(args->sync_fd[0]);

    setpgid(0, 0);

    if (args->private_mounts) {
        // Keep our /proc mount from propagating back to the host
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0 && args->mount_proc) {
            // Fails without root; the host /proc stays visible then
            mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);
        }
    }

    if (args->hostname != nullptr) {
        sethostname(args->hostname, strlen(args->hostname));
    }

    struct rlimit rl;
    rl.rlim_cur = args->cpu_seconds;
    rl.rlim_max = args->cpu_seconds + 1;
    setrlimit(RLIMIT_CPU, &rl);

    rl.rlim_cur = rl.rlim_max = 0;
    setrlimit(RLIMIT_CORE, &rl);

    if (args->file_size_bytes > 0) {
        rl.rlim_cur = rl.rlim_max = args->file_size_bytes;
        setrlimit(RLIMIT_FSIZE, &rl);
    }
    if (args->address_space_bytes > 0) {
        rl.rlim_cur = rl.rlim_max = args->address_space_bytes;
        setrlimit(RLIMIT_AS, &rl);
    }

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    dup2(args->stdout_fd, STDOUT_FILENO);
    dup2(args->stderr_fd, STDERR_FILENO);
    close(args->stdout_fd);
    close(args->stderr_fd);

    if (chdir(args->work_dir) < 0) {
        write_all(STDERR_FILENO, "caserun: cannot enter work directory\n");
        _exit(126);
    }

    execve(args->path, args->argv, args->envp);

    // If we get here, exec failed
    write_all(STDERR_FILENO, "caserun: exec failed: ");
    write_all(STDERR_FILENO, strerror(errno));
    write_all(STDERR_FILENO, "\n");
    _exit(127);
}

pid_t Sandbox::spawn(const ExecRequest& request, int stdout_fd, int stderr_fd, int sync_fd[2]) {
    std::string path = util::which(request.argv[0]);
    if (path.empty()) {
        spdlog::error("Sandbox {}: executable not found: {}", config_.name, request.argv[0]);
        return -1;
    }

    std::vector<std::string> env_strings = {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + work_dir_,
        "LANG=C.UTF-8",
        "PYTHONUNBUFFERED=1",
        "PYTHONDONTWRITEBYTECODE=1",
        "MPLBACKEND=Agg",
    };
    env_strings.insert(env_strings.end(), request.env.begin(), request.env.end());

    std::vector<char*> argv;
    for (const auto& a : request.argv) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& e : env_strings) {
        envp.push_back(const_cast<char*>(e.c_str()));
    }
    envp.push_back(nullptr);

    std::string hostname = "caserun-" + config_.name;

    // Kernel backstop: the read loop enforces the real deadline
    auto timeout_s = std::chrono::duration_cast<std::chrono::seconds>(request.timeout).count();

    ChildArgs child_args;
    child_args.path = path.c_str();
    child_args.argv = argv.data();
    child_args.envp = envp.data();
    child_args.work_dir = work_dir_.c_str();
    child_args.hostname = nullptr;
    child_args.stdout_fd = stdout_fd;
    child_args.stderr_fd = stderr_fd;
    child_args.sync_fd[0] = sync_fd[0];
    child_args.sync_fd[1] = sync_fd[1];
    child_args.private_mounts = false;
    child_args.mount_proc = false;
    child_args.cpu_seconds = static_cast<rlim_t>(timeout_s + 1);
    child_args.address_space_bytes = 0;
    child_args.file_size_bytes = static_cast<rlim_t>(config_.limits.max_file_size_bytes);

    // RLIMIT_AS only when the cgroup does not already cap memory
    if (!isolation_status_.memory_limit_applied) {
        child_args.address_space_bytes = static_cast<rlim_t>(config_.limits.memory_limit_bytes);
    }

    // Build clone flags
    int clone_flags = SIGCHLD;
    if (config_.enable_pid_namespace) clone_flags |= CLONE_NEWPID;
    if (config_.enable_mount_namespace) clone_flags |= CLONE_NEWNS;
    if (config_.enable_uts_namespace) clone_flags |= CLONE_NEWUTS;
    if (!config_.enable_network) clone_flags |= CLONE_NEWNET;

    pid_t pid = -1;
    bool namespaced = clone_flags != SIGCHLD;

    if (namespaced) {
        child_args.private_mounts = config_.enable_mount_namespace;
        child_args.mount_proc = config_.enable_pid_namespace && config_.enable_mount_namespace;
        child_args.hostname = config_.enable_uts_namespace ? hostname.c_str() : nullptr;

        std::unique_ptr<char[]> stack(new char[STACK_SIZE]);
        pid = clone(child_entry, stack.get() + STACK_SIZE, clone_flags, &child_args);

        if (pid < 0) {
            if (!degraded_logged_) {
                spdlog::warn("DEGRADED ISOLATION: clone() failed for {} ({}), falling back to fork()",
                    config_.name, strerror(errno));
                spdlog::warn("  -> Namespace isolation (PID, NET, MNT, UTS) will NOT be available");
                spdlog::warn("  -> Run as root or with CAP_SYS_ADMIN for full isolation");
            }
            isolation_status_.degraded_reason =
                "clone() failed - no namespace isolation (need root/CAP_SYS_ADMIN)";
            isolation_status_.pid_namespace = false;
            isolation_status_.mnt_namespace = false;
            isolation_status_.uts_namespace = false;
            isolation_status_.net_namespace = false;
        } else {
            isolation_status_.pid_namespace = config_.enable_pid_namespace;
            isolation_status_.mnt_namespace = config_.enable_mount_namespace;
            isolation_status_.uts_namespace = config_.enable_uts_namespace;
            isolation_status_.net_namespace = !config_.enable_network;
        }
    }

    if (pid < 0) {
        child_args.private_mounts = false;
        child_args.mount_proc = false;
        child_args.hostname = nullptr;

        pid = fork();
        if (pid < 0) {
            spdlog::error("fork() failed: {}", strerror(errno));
            return -1;
        }
        if (pid == 0) {
            _exit(child_entry(&child_args));
        }
    }

    // Parent: the child is blocked on the sync pipe until we are done here
    if (setpgid(pid, pid) < 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) failed: {}", pid, strerror(errno));
    }

    bool cgroup_assigned = false;
    if (config_.enable_cgroups && isolation_status_.cgroups_available) {
        cgroup_assigned = assign_to_cgroup(pid);
    }
    cgroup_assigned_ = cgroup_assigned;
    if (config_.enable_cgroups && !cgroup_assigned && !degraded_logged_) {
        spdlog::warn("DEGRADED ISOLATION: Process {} not added to cgroup - resource limits NOT enforced", pid);
    }

    bool namespaces_ok = (!config_.enable_pid_namespace || isolation_status_.pid_namespace) &&
                         (!config_.enable_mount_namespace || isolation_status_.mnt_namespace) &&
                         (!config_.enable_uts_namespace || isolation_status_.uts_namespace) &&
                         (config_.enable_network || isolation_status_.net_namespace);
    bool cgroups_ok = !config_.enable_cgroups ||
                      (cgroup_assigned &&
                       isolation_status_.memory_limit_applied &&
                       isolation_status_.cpu_quota_applied &&
                       isolation_status_.pids_limit_applied);
    isolation_status_.fully_isolated = namespaces_ok && cgroups_ok;

    if (!isolation_status_.fully_isolated && !degraded_logged_) {
        spdlog::warn("Sandbox {} running with PARTIAL isolation", config_.name);
        spdlog::warn("  Namespaces: pid={}, mnt={}, uts={}, net={}",
            isolation_status_.pid_namespace ? "ON" : "OFF",
            isolation_status_.mnt_namespace ? "ON" : "OFF",
            isolation_status_.uts_namespace ? "ON" : "OFF",
            isolation_status_.net_namespace ? "ON" : "OFF");
        degraded_logged_ = true;
    }

    return pid;
}

void Sandbox::kill_group(pid_t pgid) {
    if (pgid <= 0) return;
    if (kill(-pgid, SIGKILL) < 0 && errno != ESRCH) {
        spdlog::error("kill(-{}, SIGKILL) failed: {}", pgid, strerror(errno));
    }
}

ExecResult Sandbox::exec(const ExecRequest& request, const OutputCallback& on_output) {
    std::lock_guard<std::mutex> lock(exec_mutex_);
    ExecResult result;

    if (state_ != SandboxState::READY) {
        spdlog::error("Cannot exec in sandbox {} (state={})",
            config_.name, sandbox_state_to_string(state_));
        result.spawn_failed = true;
        return result;
    }
    if (request.argv.empty()) {
        spdlog::error("Sandbox {}: empty argv", config_.name);
        result.spawn_failed = true;
        return result;
    }
    if (interrupt_requested_.exchange(false)) {
        result.interrupted = true;
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int sync_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(sync_pipe, O_CLOEXEC) < 0) {
        spdlog::error("Failed to create pipes: {}", strerror(errno));
        for (int* p : {out_pipe, err_pipe, sync_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        result.spawn_failed = true;
        return result;
    }

    auto started = std::chrono::steady_clock::now();
    pid_t pid = spawn(request, out_pipe[1], err_pipe[1], sync_pipe);

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(sync_pipe[0]);

    if (pid < 0) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        close_fd(sync_pipe[1]);
        result.spawn_failed = true;
        return result;
    }

    current_pgid_ = pid;
    set_state(SandboxState::RUNNING);
    spdlog::debug("Sandbox {} exec {} (PID={}, timeout={}ms)",
        config_.name, request.argv[0], pid, request.timeout.count());

    // Release the child
    if (write(sync_pipe[1], "x", 1) < 0) {
        spdlog::error("Sandbox {}: failed to release child: {}", config_.name, strerror(errno));
    }
    close_fd(sync_pipe[1]);

    auto deadline = started + request.timeout;
    std::chrono::steady_clock::time_point drain_deadline;

    struct pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;
    int open_fds = 2;

    bool child_done = false;
    bool killed = false;
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    char buffer[READ_CHUNK];

    while (!child_done || open_fds > 0) {
        int rc = poll(fds, 2, POLL_SLICE_MS);
        if (rc < 0 && errno != EINTR) {
            spdlog::error("Sandbox {}: poll failed: {}", config_.name, strerror(errno));
            kill_group(pid);
            killed = true;
            break;
        }

        for (int i = 0; i < 2 && rc > 0; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                if (on_output) {
                    try {
                        on_output(i == 0 ? StreamKind::STDOUT : StreamKind::STDERR,
                                  std::string(buffer, static_cast<size_t>(n)));
                    } catch (const std::exception& e) {
                        spdlog::error("Sandbox {}: output callback threw: {}", config_.name, e.what());
                    }
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i].fd);
                --open_fds;
            }
        }

        auto now = std::chrono::steady_clock::now();

        if (!child_done) {
            // WNOWAIT leaves the zombie in place so the group id stays ours
            // until everything else in the group is gone
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            int r = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
            if (r == 0 && info.si_pid == pid) {
                current_pgid_ = -1;
                kill_group(pid);
                while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {
                }
                child_done = true;
                drain_deadline = now + DRAIN_GRACE;

                // Killed members stay in the group until their reaper collects them
                bool strays = kill(-pid, 0) == 0;
                if (cgroup_assigned_ && cgroup_populated()) {
                    kill_cgroup();
                    strays = true;
                }
                if (strays && !killed) {
                    result.strays_killed = true;
                    spdlog::warn("Sandbox {}: killed processes left behind by PID {}",
                        config_.name, pid);
                }
            } else if (r < 0 && errno != EINTR) {
                spdlog::error("Sandbox {}: waitid failed: {}", config_.name, strerror(errno));
                kill_group(pid);
                while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {
                }
                child_done = true;
                current_pgid_ = -1;
                drain_deadline = now;
            }
        }

        if (!child_done && !killed) {
            if (interrupt_requested_) {
                result.interrupted = true;
                kill_group(pid);
                killed = true;
                spdlog::debug("Sandbox {} interrupted (PID={})", config_.name, pid);
            } else if (now >= deadline) {
                result.timed_out = true;
                kill_group(pid);
                killed = true;
                spdlog::debug("Sandbox {} deadline reached (PID={})", config_.name, pid);
            }
        }

        if (child_done && open_fds > 0 && now >= drain_deadline) {
            // Something that left the process group still holds the pipes
            if (!killed) {
                result.strays_killed = true;
            }
            for (auto& pfd : fds) {
                close_fd(pfd.fd);
            }
            open_fds = 0;
        }
    }

    for (auto& pfd : fds) {
        close_fd(pfd.fd);
    }

    if (!child_done) {
        while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {
        }
        current_pgid_ = -1;
    }

    auto finished = std::chrono::steady_clock::now();
    result.wall_time_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(finished - started).count());
    result.cpu_time_ms =
        static_cast<uint64_t>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
        static_cast<uint64_t>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
    result.max_rss_kb = static_cast<uint64_t>(usage.ru_maxrss);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        // RLIMIT_CPU backstop fired before our own deadline check
        if (WTERMSIG(status) == SIGXCPU && !result.interrupted) {
            result.timed_out = true;
        }
    }

    interrupt_requested_ = false;
    set_state(SandboxState::READY);

    spdlog::debug("Sandbox {} exec finished (exit={}, wall={}ms, timed_out={}, interrupted={})",
        config_.name, result.exit_code, result.wall_time_ms, result.timed_out, result.interrupted);
    return result;
}

void Sandbox::interrupt() {
    interrupt_requested_ = true;
    pid_t pgid = current_pgid_.load();
    if (pgid > 0) {
        kill_group(pgid);
    }
}

bool Sandbox::write_file(const std::string& relative_path, const std::string& content) {
    fs::path rel(relative_path);
    if (!is_safe_relative(rel)) {
        spdlog::error("Sandbox {}: refusing to write unsafe path '{}'", config_.name, relative_path);
        return false;
    }

    fs::path target = fs::path(work_dir_) / rel;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        spdlog::error("Sandbox {}: cannot create {}: {}",
            config_.name, target.parent_path().string(), ec.message());
        return false;
    }

    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        spdlog::error("Sandbox {}: cannot open {}", config_.name, target.string());
        return false;
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs.good()) {
        spdlog::error("Sandbox {}: short write to {}", config_.name, target.string());
        return false;
    }
    return true;
}

std::vector<std::string> Sandbox::list_files() const {
    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(work_dir_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Sandbox {}: cannot list {}: {}", config_.name, work_dir_, ec.message());
        return files;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Sandbox {}: listing stopped early: {}", config_.name, ec.message());
            break;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(fs::relative(it->path(), work_dir_, ec).generic_string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool Sandbox::reset() {
    if (state_ == SandboxState::DESTROYED || state_ == SandboxState::FAILED) {
        return false;
    }

    std::lock_guard<std::mutex> lock(exec_mutex_);
    interrupt_requested_ = false;

    std::error_code ec;
    for (fs::directory_iterator it(work_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        fs::remove_all(it->path(), ec);
        if (ec) break;
    }
    if (ec) {
        spdlog::error("Sandbox {}: failed to clear work directory: {}", config_.name, ec.message());
        return false;
    }

    spdlog::trace("Sandbox {} reset", config_.name);
    return true;
}

bool Sandbox::destroy() {
    if (state_ == SandboxState::DESTROYED) {
        return true;
    }
    if (state_ == SandboxState::RUNNING) {
        interrupt();
    }

    std::lock_guard<std::mutex> lock(exec_mutex_);

    bool ok = cleanup_cgroups();

    std::error_code ec;
    fs::remove_all(base_dir_, ec);
    if (ec) {
        spdlog::warn("Sandbox {}: failed to remove {}: {}", config_.name, base_dir_, ec.message());
        ok = false;
    }

    set_state(SandboxState::DESTROYED);
    spdlog::debug("Sandbox {} destroyed", config_.name);
    return ok;
}

void Sandbox::set_state(SandboxState new_state) {
    state_ = new_state;
}

} // namespace caserun::runtime
