#pragma once
#include <memory>
#include <string>
#include "pool/sandbox_pool.hpp"

namespace sandpool::pool {

// Scoped acquisition of a pooled handle. Releases its reference exactly
// once, on destruction or release(); a released lease is empty.
class SandboxLease {
public:
    SandboxLease() = default;
    SandboxLease(std::shared_ptr<SandboxPool> pool, std::string sandbox_id, HandlePtr handle);
    ~SandboxLease();

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;
    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;

    void release();

    const HandlePtr& handle() const { return handle_; }
    runtime::ContainerHandle* operator->() const { return handle_.get(); }
    const std::string& sandbox_id() const { return sandbox_id_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    std::shared_ptr<SandboxPool> pool_;
    std::string sandbox_id_;
    HandlePtr handle_;
};

} // namespace sandpool::pool
