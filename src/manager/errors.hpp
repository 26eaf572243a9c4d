#pragma once
#include <stdexcept>
#include <string>
#include "store/sandbox_record.hpp"

namespace sandpool::manager {

// ensure_running could not bring a sandbox up. Maps to 503 at the API layer.
class SandboxUnavailable : public std::runtime_error {
public:
    static constexpr int STATUS_CODE = 503;

    SandboxUnavailable(std::string user_id, std::string sandbox_id, const std::string& reason)
        : std::runtime_error("Failed to start sandbox: " + reason)
        , user_id_(std::move(user_id))
        , sandbox_id_(std::move(sandbox_id)) {}

    const std::string& user_id() const { return user_id_; }
    const std::string& sandbox_id() const { return sandbox_id_; }
    int status_code() const { return STATUS_CODE; }

private:
    std::string user_id_;
    std::string sandbox_id_;
};

// Internal bug: an edge the state machine does not have
class IllegalTransition : public std::logic_error {
public:
    IllegalTransition(store::SandboxStatus from, store::SandboxStatus to)
        : std::logic_error(std::string("Illegal sandbox transition ") +
                           store::sandbox_status_to_string(from) + " -> " +
                           store::sandbox_status_to_string(to))
        , from_(from)
        , to_(to) {}

    store::SandboxStatus from() const { return from_; }
    store::SandboxStatus to() const { return to_; }

private:
    store::SandboxStatus from_;
    store::SandboxStatus to_;
};

} // namespace sandpool::manager
