#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/jobs/session_store.hpp"

#include <string>

namespace fetchd::jobs {

/**
 * @brief Cooperative cancel signal for a session's running job
 *
 * The flag itself lives in the SessionStore so it is created and destroyed
 * together with the session. Nothing here stops a worker directly: the
 * progress callback calls check() on every event and hands the Canceled
 * error back to the fetch collaborator, which aborts and returns it.
 */
class CancellationController {
public:
    explicit CancellationController(SessionStore& store) : store_(store) {}

    /**
     * @brief Raise the flag; harmless when no job is running
     *
     * @return false when the session was closed
     */
    bool request_cancel(const std::string& session_id);

    [[nodiscard]] bool is_cancel_requested(const std::string& session_id) const;

    void clear(const std::string& session_id);

    /**
     * @return ErrorKind::Canceled while the flag is raised
     */
    Result<void> check(const std::string& session_id) const;

private:
    SessionStore& store_;
};

} // namespace fetchd::jobs
