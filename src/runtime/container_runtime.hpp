/**
 * Container runtime capability
 *
 * The pool and manager only ever see these two interfaces. A runtime
 * starts containers; a handle is one live container.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandpool::runtime {

// Host directory exposed inside the container
struct VolumeMount {
    std::string host_path;
    std::string container_path;
    bool read_only = false;
};

struct ContainerSpec {
    std::string image;
    std::string session_id;              // Sandbox id
    uint32_t idle_timeout_sec = 3600;
    std::vector<VolumeMount> volumes;
    double cpu_limit = 1.0;              // Cores, 0 = unlimited
    uint64_t memory_limit_mb = 0;        // 0 = unlimited
};

// Thrown by ContainerRuntime::start when a container cannot be brought up
class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ContainerHandle {
public:
    virtual ~ContainerHandle() = default;

    // Liveness check
    virtual bool is_started() const = 0;

    // Stop the container process. Idempotent.
    virtual void stop() = 0;

    // Stop and release everything the container holds. Idempotent.
    virtual void cleanup() = 0;

    // Runtime-level reference, empty if the runtime has none
    virtual std::string container_ref() const { return {}; }
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Start a container. Throws RuntimeError on failure.
    virtual std::shared_ptr<ContainerHandle> start(const ContainerSpec& spec) = 0;

    virtual std::string name() const = 0;
};

} // namespace sandpool::runtime
