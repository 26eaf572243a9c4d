#include "pool/sandbox_lease.hpp"

namespace sandpool::pool {

SandboxLease::SandboxLease(std::shared_ptr<SandboxPool> pool, std::string sandbox_id, HandlePtr handle)
    : pool_(std::move(pool))
    , sandbox_id_(std::move(sandbox_id))
    , handle_(std::move(handle)) {}

SandboxLease::~SandboxLease() {
    release();
}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : pool_(std::move(other.pool_))
    , sandbox_id_(std::move(other.sandbox_id_))
    , handle_(std::move(other.handle_)) {
    other.pool_.reset();
    other.handle_.reset();
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::move(other.pool_);
        sandbox_id_ = std::move(other.sandbox_id_);
        handle_ = std::move(other.handle_);
        other.pool_.reset();
        other.handle_.reset();
    }
    return *this;
}

void SandboxLease::release() {
    if (pool_ && handle_) {
        // The entry may have been replaced by an explicit stop and a
        // recreation; only our own handle is released
        pool_->release(sandbox_id_, handle_);
    }
    pool_.reset();
    handle_.reset();
}

} // namespace sandpool::pool
