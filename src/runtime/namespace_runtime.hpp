/**
 * Namespace container runtime
 *
 * Built-in local runtime: each container is a keep-alive process cloned
 * into new PID, mount, UTS and network namespaces, placed in a cgroup v2
 * group carrying the sandbox's CPU and memory limits. Volumes are bind
 * mounted inside the mount namespace.
 *
 * Requires root/CAP_SYS_ADMIN for full isolation; without it the process
 * is started with fork() and the degraded isolation is logged.
 */
#pragma once
#include "runtime/container_runtime.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

namespace sandpool::runtime {

struct ResourceLimits {
    uint64_t memory_limit_bytes = 0;     // 0 = unlimited
    uint64_t cpu_quota_us = 0;           // 0 = unlimited
    uint64_t cpu_period_us = 100000;     // 100ms period
    uint64_t max_pids = 256;

    static ResourceLimits from_spec(const ContainerSpec& spec, uint64_t max_pids);
};

struct NamespaceOptions {
    std::vector<std::string> command = {"sleep", "infinity"};
    std::string cgroup_root = "/sys/fs/cgroup/sandpool";
    uint64_t max_pids = 256;
    int stop_timeout_ms = 5000;

    bool enable_network = false;         // false = private network namespace
    bool enable_pid_namespace = true;
    bool enable_mount_namespace = true;
    bool enable_uts_namespace = true;
    bool enable_cgroups = true;
};

// Tracks what isolation features are actually active
struct IsolationStatus {
    bool pid_namespace = false;
    bool net_namespace = false;
    bool mnt_namespace = false;
    bool uts_namespace = false;

    bool cgroups_available = false;
    bool memory_limit_applied = false;
    bool cpu_quota_applied = false;
    bool pids_limit_applied = false;

    bool fully_isolated = false;
    std::string degraded_reason;

    bool is_degraded() const { return !fully_isolated && !degraded_reason.empty(); }
};

class NamespaceContainer : public ContainerHandle {
public:
    NamespaceContainer(const ContainerSpec& spec, const NamespaceOptions& options);
    ~NamespaceContainer() override;

    NamespaceContainer(const NamespaceContainer&) = delete;
    NamespaceContainer& operator=(const NamespaceContainer&) = delete;

    // Clone and exec the keep-alive process. Throws RuntimeError.
    void launch();

    bool is_started() const override;
    void stop() override;
    void cleanup() override;
    std::string container_ref() const override;

    pid_t pid() const;
    int exit_code() const;
    IsolationStatus isolation_status() const;
    const std::string& session_id() const { return spec_.session_id; }

private:
    ContainerSpec spec_;
    NamespaceOptions options_;
    ResourceLimits limits_;
    std::string cgroup_path_;
    std::string rootfs_;                 // Set when the image names a directory

    mutable std::mutex mutex_;
    mutable pid_t child_pid_ = -1;
    mutable int exit_code_ = -1;
    mutable bool running_ = false;
    IsolationStatus isolation_status_;

    void setup_cgroups();
    void cleanup_cgroups();
    bool assign_cgroup(pid_t pid);

    // Caller must hold mutex_
    void stop_locked();
    bool reap_locked(int wait_options) const;

    // Child process entry point (runs in the new namespaces)
    static int child_entry(void* arg);
};

class NamespaceRuntime : public ContainerRuntime {
public:
    explicit NamespaceRuntime(NamespaceOptions options = {});

    std::shared_ptr<ContainerHandle> start(const ContainerSpec& spec) override;
    std::string name() const override { return "namespace"; }

    const NamespaceOptions& options() const { return options_; }

private:
    NamespaceOptions options_;

    bool init_cgroup_root();
};

} // namespace sandpool::runtime
