#include "fetchd/jobs/state_machine.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace fetchd::jobs {
namespace {

bool is_progressive(JobPhase current, JobPhase target) {
    static const std::unordered_map<JobPhase, std::vector<JobPhase>> transitions {
        {JobPhase::Ready, {JobPhase::Processing}},
        {JobPhase::Processing, {JobPhase::Starting, JobPhase::Error}},
        {JobPhase::Starting, {JobPhase::Downloading, JobPhase::Canceled, JobPhase::Error}},
        {JobPhase::Downloading, {JobPhase::Finished, JobPhase::Canceled, JobPhase::Error}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

bool JobStateMachine::can_transition(JobPhase current, JobPhase target) noexcept {
    if (current == target) {
        return true;
    }
    if (is_terminal(current)) {
        return false;
    }
    return is_progressive(current, target);
}

Result<void> JobStateMachine::transition_to(JobState& job, JobPhase next) {
    if (job.phase == next) {
        return Ok();
    }

    if (!can_transition(job.phase, next)) {
        return Err<void>(Error::internal(std::string("Illegal job phase transition: ") +
                                         to_string(job.phase) + " -> " + to_string(next)));
    }

    job.phase = next;
    if (next != JobPhase::Error) {
        job.error_message.reset();
    }
    return Ok();
}

Result<void> JobStateMachine::mark_failed(JobState& job, std::string error_message) {
    auto result = transition_to(job, JobPhase::Error);
    if (result.is_ok()) {
        job.error_message = std::move(error_message);
        job.current_item_label.clear();
    }
    return result;
}

Result<void> JobStateMachine::mark_canceled(JobState& job) {
    auto result = transition_to(job, JobPhase::Canceled);
    if (result.is_ok()) {
        job.error_message.reset();
        job.current_item_label.clear();
    }
    return result;
}

} // namespace fetchd::jobs
