/**
 * Sandbox status state machine
 *
 *   pending  -> creating -> running -> stopped -> creating ...
 *   pending  -> failed,  creating -> failed,  failed -> creating (retry)
 *   any state except terminating -> terminating (delete)
 *
 * stopped and failed are only terminal until the next ensure_running;
 * terminating is the one true end state.
 */
#pragma once
#include "store/sandbox_record.hpp"

namespace sandpool::manager {

bool is_legal_transition(store::SandboxStatus from, store::SandboxStatus to);

// States from which ensure_running may start a container
bool can_start_from(store::SandboxStatus status);

} // namespace sandpool::manager
