#include "runtime/namespace_runtime.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sched.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace sandpool::runtime {

// Stack size for clone()
constexpr size_t STACK_SIZE = 1024 * 1024;

namespace {

struct BindMount {
    std::string source;
    std::string target;
    bool read_only = false;
};

// Everything the child needs, prepared before clone() so the child
// never allocates
struct ChildArgs {
    std::vector<std::string> command;
    std::vector<char*> argv;
    std::string hostname;
    std::string rootfs;
    std::string workdir;
    std::vector<BindMount> mounts;
    bool uts_namespace = false;
    bool mount_namespace = false;
    bool pid_namespace = false;
    int sync_read_fd = -1;               // Parent writes once the cgroup is set
    int sync_write_fd = -1;
    int status_fd = -1;                  // CLOEXEC; errno written on failure
};

[[noreturn]] void report_and_exit(int status_fd, int err) {
    if (status_fd >= 0) {
        ssize_t n = write(status_fd, &err, sizeof(err));
        (void)n;
    }
    _exit(127);
}

bool write_cgroup_file(const std::string& path, const std::string& value) {
    if (!fs::exists(path)) {
        return false;
    }
    try {
        std::ofstream ofs(path);
        if (!ofs.is_open()) return false;
        ofs << value;
        return ofs.good();
    } catch (const std::exception& e) {
        spdlog::debug("Cannot write {}: {}", path, e.what());
        return false;
    }
}

} // namespace

ResourceLimits ResourceLimits::from_spec(const ContainerSpec& spec, uint64_t max_pids) {
    ResourceLimits limits;
    limits.memory_limit_bytes = spec.memory_limit_mb * 1024 * 1024;
    if (spec.cpu_limit > 0.0) {
        limits.cpu_quota_us = static_cast<uint64_t>(spec.cpu_limit * limits.cpu_period_us);
    }
    limits.max_pids = max_pids;
    return limits;
}

// ============================================================================
// NamespaceContainer Implementation
// ============================================================================

NamespaceContainer::NamespaceContainer(const ContainerSpec& spec, const NamespaceOptions& options)
    : spec_(spec)
    , options_(options)
    , limits_(ResourceLimits::from_spec(spec, options.max_pids)) {
    cgroup_path_ = options_.cgroup_root + "/" + spec_.session_id;

    std::error_code ec;
    if (!spec_.image.empty() && spec_.image.front() == '/' && fs::is_directory(spec_.image, ec)) {
        rootfs_ = spec_.image;
    } else {
        spdlog::debug("Container {}: image '{}' is not a root filesystem, sharing host root",
            spec_.session_id, spec_.image);
    }
}

NamespaceContainer::~NamespaceContainer() {
    cleanup();
}

void NamespaceContainer::setup_cgroups() {
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers")) {
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - limits for {} will NOT be enforced",
            spec_.session_id);
        isolation_status_.degraded_reason = "cgroup v2 not available";
        return;
    }
    isolation_status_.cgroups_available = true;

    try {
        fs::create_directories(cgroup_path_);
    } catch (const std::exception& e) {
        spdlog::warn("DEGRADED ISOLATION: Cannot create cgroup {} (need root): {}", cgroup_path_, e.what());
        isolation_status_.degraded_reason = "Cannot create sandbox cgroup (need root)";
        return;
    }

    std::string memory_max = limits_.memory_limit_bytes > 0
        ? std::to_string(limits_.memory_limit_bytes) : "max";
    isolation_status_.memory_limit_applied = write_cgroup_file(cgroup_path_ + "/memory.max", memory_max);

    std::string quota = limits_.cpu_quota_us > 0 ? std::to_string(limits_.cpu_quota_us) : "max";
    isolation_status_.cpu_quota_applied = write_cgroup_file(
        cgroup_path_ + "/cpu.max", quota + " " + std::to_string(limits_.cpu_period_us));

    isolation_status_.pids_limit_applied = write_cgroup_file(
        cgroup_path_ + "/pids.max", std::to_string(limits_.max_pids));

    if (!isolation_status_.memory_limit_applied ||
        !isolation_status_.cpu_quota_applied ||
        !isolation_status_.pids_limit_applied) {
        spdlog::warn("Container {} running with partial cgroup limits: memory={}, cpu={}, pids={}",
            spec_.session_id,
            isolation_status_.memory_limit_applied ? "ON" : "OFF",
            isolation_status_.cpu_quota_applied ? "ON" : "OFF",
            isolation_status_.pids_limit_applied ? "ON" : "OFF");
    } else {
        spdlog::debug("Container {} cgroup limits: memory={} cpu={}/{}us pids={}",
            spec_.session_id, memory_max, quota, limits_.cpu_period_us, limits_.max_pids);
    }
}

bool NamespaceContainer::assign_cgroup(pid_t pid) {
    if (!isolation_status_.cgroups_available) {
        return false;
    }
    if (write_cgroup_file(cgroup_path_ + "/cgroup.procs", std::to_string(pid))) {
        spdlog::debug("Added PID {} to cgroup {}", pid, cgroup_path_);
        return true;
    }

    spdlog::warn("DEGRADED ISOLATION: Process {} not added to cgroup - resource limits NOT enforced", pid);
    isolation_status_.memory_limit_applied = false;
    isolation_status_.cpu_quota_applied = false;
    isolation_status_.pids_limit_applied = false;
    return false;
}

void NamespaceContainer::cleanup_cgroups() {
    std::error_code ec;
    if (!options_.enable_cgroups || !fs::exists(cgroup_path_, ec)) {
        return;
    }
    // A cgroup directory is removed with rmdir, never recursively
    if (!fs::remove(cgroup_path_, ec) && ec) {
        spdlog::warn("Failed to remove cgroup {}: {}", cgroup_path_, ec.message());
    } else {
        spdlog::debug("Cleaned up cgroup: {}", cgroup_path_);
    }
}

int NamespaceContainer::child_entry(void* arg) {
    auto* args = static_cast<ChildArgs*>(arg);

    close(args->sync_write_fd);

    // Wait for the parent to place us in the cgroup
    char buf;
    while (read(args->sync_read_fd, &buf, 1) < 0 && errno == EINTR) {
    }
    close(args->sync_read_fd);

    if (args->uts_namespace) {
        // Best effort: the hostname is cosmetic
        sethostname(args->hostname.c_str(), args->hostname.size());
    }

    if (args->mount_namespace) {
        // Keep our mounts out of the host's view
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
            report_and_exit(args->status_fd, errno);
        }

        for (const auto& m : args->mounts) {
            mkdir(m.target.c_str(), 0755);
            if (mount(m.source.c_str(), m.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) < 0) {
                report_and_exit(args->status_fd, errno);
            }
            if (m.read_only &&
                mount(nullptr, m.target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY, nullptr) < 0) {
                report_and_exit(args->status_fd, errno);
            }
        }

        if (!args->rootfs.empty()) {
            if (chroot(args->rootfs.c_str()) < 0 || chdir("/") < 0) {
                report_and_exit(args->status_fd, errno);
            }
        }

        if (args->pid_namespace) {
            // May fail without root, that's ok
            mount("proc", "/proc", "proc", 0, nullptr);
        }
    }

    if (!args->workdir.empty()) {
        // Falls back to the inherited working directory
        int rc = chdir(args->workdir.c_str());
        (void)rc;
    }

    execvp(args->argv[0], args->argv.data());
    report_and_exit(args->status_fd, errno);
}

void NamespaceContainer::launch() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_) {
        throw RuntimeError(fmt::format("Container {} already running", spec_.session_id));
    }
    if (options_.command.empty()) {
        throw RuntimeError("No keep-alive command configured");
    }

    spdlog::info("Starting container {} (image={})", spec_.session_id, spec_.image);

    if (options_.enable_cgroups) {
        setup_cgroups();
    }

    ChildArgs args;
    args.command = options_.command;
    for (auto& part : args.command) {
        args.argv.push_back(part.data());
    }
    args.argv.push_back(nullptr);
    args.hostname = "sandpool-" + spec_.session_id.substr(0, 12);
    args.rootfs = rootfs_;
    args.uts_namespace = options_.enable_uts_namespace;
    args.mount_namespace = options_.enable_mount_namespace;
    args.pid_namespace = options_.enable_pid_namespace;
    for (const auto& volume : spec_.volumes) {
        args.mounts.push_back({volume.host_path, rootfs_ + volume.container_path, volume.read_only});
    }
    if (!spec_.volumes.empty()) {
        args.workdir = spec_.volumes.front().container_path;
    }

    int sync_pipe[2];
    if (pipe2(sync_pipe, O_CLOEXEC) < 0) {
        throw RuntimeError(fmt::format("pipe() failed: {}", strerror(errno)));
    }
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(sync_pipe[0]);
        close(sync_pipe[1]);
        throw RuntimeError(fmt::format("pipe() failed: {}", strerror(err)));
    }
    args.sync_read_fd = sync_pipe[0];
    args.sync_write_fd = sync_pipe[1];
    args.status_fd = status_pipe[1];

    int clone_flags = SIGCHLD;
    if (options_.enable_pid_namespace)   clone_flags |= CLONE_NEWPID;
    if (options_.enable_mount_namespace) clone_flags |= CLONE_NEWNS;
    if (options_.enable_uts_namespace)   clone_flags |= CLONE_NEWUTS;
    if (!options_.enable_network)        clone_flags |= CLONE_NEWNET;

    auto stack = std::make_unique<char[]>(STACK_SIZE);
    pid_t pid = clone(child_entry, stack.get() + STACK_SIZE, clone_flags, &args);
    bool namespaced = pid >= 0;

    if (pid < 0) {
        spdlog::warn("DEGRADED ISOLATION: clone() failed for {} ({}), falling back to fork()",
            spec_.session_id, strerror(errno));
        spdlog::warn("  -> Namespace isolation (PID, NET, MNT, UTS) will NOT be available");
        isolation_status_.degraded_reason = "clone() failed - no namespace isolation (need root/CAP_SYS_ADMIN)";

        // No private mount namespace: work directly in the host directory
        args.uts_namespace = false;
        args.mount_namespace = false;
        args.pid_namespace = false;
        if (!spec_.volumes.empty()) {
            args.workdir = spec_.volumes.front().host_path;
        }

        pid = fork();
        if (pid == 0) {
            _exit(child_entry(&args));
        }
    }

    close(sync_pipe[0]);
    close(status_pipe[1]);

    if (pid < 0) {
        int err = errno;
        close(sync_pipe[1]);
        close(status_pipe[0]);
        cleanup_cgroups();
        throw RuntimeError(fmt::format("fork() failed for {}: {}", spec_.session_id, strerror(err)));
    }

    child_pid_ = pid;

    if (namespaced) {
        isolation_status_.pid_namespace = options_.enable_pid_namespace;
        isolation_status_.mnt_namespace = options_.enable_mount_namespace;
        isolation_status_.uts_namespace = options_.enable_uts_namespace;
        isolation_status_.net_namespace = !options_.enable_network;
    }

    if (options_.enable_cgroups) {
        assign_cgroup(pid);
    }

    // Release the child, then wait for exec: EOF on the CLOEXEC pipe means success
    ssize_t written = write(sync_pipe[1], "x", 1);
    (void)written;
    close(sync_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        waitpid(pid, nullptr, 0);
        child_pid_ = -1;
        cleanup_cgroups();
        throw RuntimeError(fmt::format("Container {} failed to start '{}': {}",
            spec_.session_id, options_.command.front(), strerror(child_errno)));
    }

    running_ = true;

    bool namespaces_ok = namespaced;
    bool cgroups_ok = !options_.enable_cgroups ||
                      (isolation_status_.memory_limit_applied &&
                       isolation_status_.cpu_quota_applied &&
                       isolation_status_.pids_limit_applied);
    isolation_status_.fully_isolated = namespaces_ok && cgroups_ok;

    if (isolation_status_.fully_isolated) {
        spdlog::info("Container {} started with FULL isolation (PID={})", spec_.session_id, pid);
    } else {
        spdlog::warn("Container {} started with PARTIAL isolation (PID={})", spec_.session_id, pid);
        spdlog::warn("  Namespaces: pid={}, mnt={}, uts={}, net={}",
            isolation_status_.pid_namespace ? "ON" : "OFF",
            isolation_status_.mnt_namespace ? "ON" : "OFF",
            isolation_status_.uts_namespace ? "ON" : "OFF",
            isolation_status_.net_namespace ? "ON" : "OFF");
    }
}

bool NamespaceContainer::reap_locked(int wait_options) const {
    int status = 0;
    pid_t result = waitpid(child_pid_, &status, wait_options);

    if (result == child_pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        running_ = false;
        return true;
    }
    if (result == 0) {
        return false;
    }
    if (errno == EINTR) {
        return false;
    }
    // Not our child any more
    running_ = false;
    return true;
}

bool NamespaceContainer::is_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || child_pid_ <= 0) {
        return false;
    }
    return !reap_locked(WNOHANG);
}

void NamespaceContainer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_locked();
}

void NamespaceContainer::stop_locked() {
    if (!running_ || child_pid_ <= 0) {
        return;
    }
    if (reap_locked(WNOHANG)) {
        return;
    }

    spdlog::info("Stopping container {} (PID={})", spec_.session_id, child_pid_);

    if (kill(child_pid_, SIGTERM) < 0) {
        if (errno == ESRCH) {
            reap_locked(WNOHANG);
            running_ = false;
            return;
        }
        spdlog::error("kill(SIGTERM) failed: {}", strerror(errno));
    }

    int waited = 0;
    const int interval = 50;
    while (waited < options_.stop_timeout_ms) {
        if (reap_locked(WNOHANG)) {
            spdlog::info("Container {} stopped (exit={})", spec_.session_id, exit_code_);
            return;
        }
        usleep(interval * 1000);
        waited += interval;
    }

    // PID 1 of a PID namespace ignores SIGTERM without a handler
    spdlog::warn("Container {} not responding, sending SIGKILL", spec_.session_id);
    kill(child_pid_, SIGKILL);
    reap_locked(0);
}

void NamespaceContainer::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_locked();
    cleanup_cgroups();
}

std::string NamespaceContainer::container_ref() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_pid_ > 0 ? "ns-" + std::to_string(child_pid_) : std::string();
}

pid_t NamespaceContainer::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_pid_;
}

int NamespaceContainer::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

IsolationStatus NamespaceContainer::isolation_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isolation_status_;
}

// ============================================================================
// NamespaceRuntime Implementation
// ============================================================================

NamespaceRuntime::NamespaceRuntime(NamespaceOptions options)
    : options_(std::move(options)) {
    if (options_.enable_cgroups) {
        init_cgroup_root();
    }
}

bool NamespaceRuntime::init_cgroup_root() {
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers")) {
        spdlog::warn("cgroup v2 not available");
        return false;
    }

    if (!fs::exists(options_.cgroup_root)) {
        try {
            fs::create_directories(options_.cgroup_root);
            spdlog::info("Created cgroup root: {}", options_.cgroup_root);
        } catch (const std::exception& e) {
            spdlog::warn("Cannot create cgroup root (need root): {}", e.what());
            return false;
        }
    }

    // Delegate controllers to sandbox groups
    std::string subtree_control =
        (fs::path(options_.cgroup_root).parent_path() / "cgroup.subtree_control").string();
    if (!write_cgroup_file(subtree_control, "+cpu +memory +pids")) {
        spdlog::debug("Could not enable cgroup controllers in {}", subtree_control);
    }
    write_cgroup_file(options_.cgroup_root + "/cgroup.subtree_control", "+cpu +memory +pids");

    return true;
}

std::shared_ptr<ContainerHandle> NamespaceRuntime::start(const ContainerSpec& spec) {
    auto container = std::make_shared<NamespaceContainer>(spec, options_);
    container->launch();
    return container;
}

} // namespace sandpool::runtime
