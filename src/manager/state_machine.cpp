#include "manager/state_machine.hpp"

namespace sandpool::manager {

using store::SandboxStatus;

bool is_legal_transition(SandboxStatus from, SandboxStatus to) {
    if (from == SandboxStatus::TERMINATING) {
        return false;
    }
    if (to == SandboxStatus::TERMINATING) {
        return true;
    }

    switch (from) {
        case SandboxStatus::PENDING:
            return to == SandboxStatus::CREATING || to == SandboxStatus::FAILED;
        case SandboxStatus::CREATING:
            return to == SandboxStatus::RUNNING || to == SandboxStatus::FAILED;
        case SandboxStatus::RUNNING:
            return to == SandboxStatus::STOPPED;
        case SandboxStatus::STOPPED:
        case SandboxStatus::FAILED:
            return to == SandboxStatus::CREATING;
        default:
            return false;
    }
}

bool can_start_from(SandboxStatus status) {
    return is_legal_transition(status, SandboxStatus::CREATING);
}

} // namespace sandpool::manager
