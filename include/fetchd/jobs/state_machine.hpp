#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/jobs/types.hpp"

#include <string>

namespace fetchd::jobs {

/**
 * @brief Legal phase transitions of a job
 *
 * Ready -> Processing -> Starting -> Downloading -> Finished, with Error
 * reachable from every non-terminal working phase and Canceled reachable once
 * the transfer has been started. Terminal phases accept nothing but themselves.
 */
class JobStateMachine {
public:
    [[nodiscard]] static bool can_transition(JobPhase current, JobPhase target) noexcept;

    static Result<void> transition_to(JobState& job, JobPhase next);
    static Result<void> mark_failed(JobState& job, std::string error_message);
    static Result<void> mark_canceled(JobState& job);
};

} // namespace fetchd::jobs
