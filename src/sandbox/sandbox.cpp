#include "sandbox/sandbox.hpp"

namespace arbiter::sandbox {

void cancellation_token::cancel() {
    cancelled = true;
}

bool cancellation_token::is_cancelled() const {
    return cancelled;
}

sandbox::~sandbox() = default;

bool execution_report::succeeded() const {
    return spawned && !cancelled && violation == limit_violation::NONE && exit_code == 0;
}

}  // namespace arbiter::sandbox
