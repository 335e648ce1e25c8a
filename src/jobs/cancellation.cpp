#include "fetchd/jobs/cancellation.hpp"

#include <spdlog/spdlog.h>

namespace fetchd::jobs {

bool CancellationController::request_cancel(const std::string& session_id) {
    if (!store_.arm_cancel(session_id)) {
        spdlog::debug("Ignoring cancel for closed session {}", session_id);
        return false;
    }
    spdlog::info("Cancel requested for session {}", session_id);
    return true;
}

bool CancellationController::is_cancel_requested(const std::string& session_id) const {
    return store_.is_cancel_requested(session_id);
}

void CancellationController::clear(const std::string& session_id) {
    store_.set_cancel_requested(session_id, false);
}

Result<void> CancellationController::check(const std::string& session_id) const {
    if (store_.is_cancel_requested(session_id)) {
        return Err<void>(Error::canceled());
    }
    return Ok();
}

} // namespace fetchd::jobs
