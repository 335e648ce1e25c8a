#include "fetchd/jobs/service.hpp"
#include "fetchd/events/events.hpp"
#include "fetchd/jobs/state_machine.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fetchd::jobs {

JobService::JobService(SessionStore& store, fetch::FetchService& fetch_service, events::EventBus& bus)
    : store_(store),
      event_bus_(bus),
      cancellation_(store),
      preview_resolver_(fetch_service),
      runner_(store, cancellation_, fetch_service, bus) {
}

JobService::~JobService() {
    wait_idle();
}

std::string JobService::open_session(const std::string& preferred_id) {
    return store_.get_or_create(preferred_id).id;
}

Result<SubmitReceipt> JobService::submit_job(const std::string& session_id, const JobRequest& request) {
    if (session_id.empty()) {
        return Err<SubmitReceipt>(Error::input("Missing session"));
    }
    if (is_blank(request.source_ref)) {
        return Err<SubmitReceipt>(Error::input("Missing URL"));
    }

    auto preview = store_.take_preview(session_id);
    auto reset = store_.reset(session_id);
    if (reset.is_error()) {
        return Err<SubmitReceipt>(reset.error());
    }
    const auto generation = reset.value();

    JobTicket ticket{session_id, generation, request, std::move(preview)};
    const bool fast_path = ticket.has_matching_preview();

    Result<void> accepted = Ok();
    auto installed = store_.update(session_id, generation, [&request, &accepted](Session& session) {
        JobState job;
        job.source_ref = request.source_ref;
        job.kind = request.kind;
        job.quality = request.quality;
        accepted = JobStateMachine::transition_to(job, JobPhase::Processing);
        session.job = std::move(job);
    });
    if (installed.is_error()) {
        return Err<SubmitReceipt>(installed.error());
    }
    if (accepted.is_error()) {
        return Err<SubmitReceipt>(accepted.error());
    }

    event_bus_.emit(events::JobSubmittedEvent{session_id, generation, request.source_ref, request.kind, fast_path});
    event_bus_.emit(events::JobPhaseChangedEvent{session_id, generation, JobPhase::Ready, JobPhase::Processing});

    std::lock_guard lock(workers_mutex_);
    reap_finished_workers();
    try {
        workers_.emplace_back(std::async(std::launch::async, [this, ticket]() {
            runner_.run(ticket);
        }));
    } catch (const std::system_error& e) {
        spdlog::error("Could not dispatch worker for session {}: {}", session_id, e.what());
        bool recorded = false;
        auto failed = store_.update(session_id, generation, [&e, &recorded](Session& session) {
            if (session.job) {
                recorded = JobStateMachine::mark_failed(*session.job,
                                                        std::string("Could not start worker: ") + e.what()).is_ok();
            }
        });
        if (failed.is_error() || !recorded) {
            spdlog::debug("Session {} moved on before dispatch failure was recorded", session_id);
        }
        return Err<SubmitReceipt>(Error::internal(std::string("Could not start worker: ") + e.what()));
    }

    return Ok(SubmitReceipt{session_id, generation, fast_path});
}

JobStatus JobService::get_status(const std::string& session_id) const {
    JobStatus status;
    status.session_id = session_id;

    auto session = store_.get(session_id);
    if (!session) {
        return status;
    }
    status.generation = session->generation;
    status.cancel_requested = session->cancel_requested;
    status.history_size = session->history.size();
    if (session->job) {
        status.job = std::move(*session->job);
    }
    return status;
}

bool JobService::request_cancel(const std::string& session_id) {
    return cancellation_.request_cancel(session_id);
}

std::size_t JobService::cancel_all() {
    const auto raised = store_.cancel_all();
    if (raised > 0) {
        spdlog::info("Canceling {} running job(s)", raised);
    }
    return raised;
}

Result<void> JobService::reset_session(const std::string& session_id) {
    auto reset = store_.reset(session_id);
    if (reset.is_error()) {
        return Err<void>(reset.error());
    }
    return Ok();
}

bool JobService::close_session(const std::string& session_id) {
    return store_.remove(session_id);
}

Result<PreviewResult> JobService::preview(const std::string& source_ref, const std::string& session_id) {
    auto result = preview_resolver_.preview(source_ref);
    if (result.is_ok() && !session_id.empty() && !store_.store_preview(session_id, result.value())) {
        return Err<PreviewResult>(Error::not_found("Unknown session: " + session_id));
    }
    return result;
}

std::vector<JobRecord> JobService::history(const std::string& session_id) const {
    return store_.history(session_id);
}

void JobService::wait_idle() {
    while (true) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(workers_mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& worker : pending) {
            if (worker.valid()) {
                worker.wait();
            }
        }
    }
}

std::size_t JobService::active_workers() {
    std::lock_guard lock(workers_mutex_);
    reap_finished_workers();
    return workers_.size();
}

void JobService::reap_finished_workers() {
    workers_.erase(
        std::remove_if(workers_.begin(), workers_.end(), [](std::future<void>& worker) {
            return !worker.valid() ||
                   worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }),
        workers_.end()
    );
}

} // namespace fetchd::jobs
