#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/events/event_bus.hpp"
#include "fetchd/fetch/fetch_service.hpp"
#include "fetchd/jobs/cancellation.hpp"
#include "fetchd/jobs/preview.hpp"
#include "fetchd/jobs/runner.hpp"
#include "fetchd/jobs/session_store.hpp"
#include "fetchd/jobs/types.hpp"

#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace fetchd::jobs {

/**
 * @brief Entry point for the presentation layer
 *
 * Every call returns promptly: submit_job() validates, resets the session and
 * dispatches a worker; status reads copy a snapshot. Only the workers block,
 * inside the fetch collaborator.
 */
class JobService {
public:
    JobService(SessionStore& store, fetch::FetchService& fetch_service, events::EventBus& bus);
    ~JobService();

    JobService(const JobService&) = delete;
    JobService& operator=(const JobService&) = delete;

    /**
     * @brief Resolve the caller's session, creating one when needed
     *
     * @return The id to use from now on (differs from `preferred_id` when that
     *         session was torn down or never existed under an empty id)
     */
    std::string open_session(const std::string& preferred_id = {});

    /**
     * @brief Start a job, replacing whatever the session was running
     *
     * A superseded worker keeps running but can no longer write to the session.
     *
     * @return ErrorKind::Input for a missing source reference and NotFound for a
     *         closed session; nothing is mutated then
     */
    Result<SubmitReceipt> submit_job(const std::string& session_id, const JobRequest& request);

    /**
     * @brief Snapshot of the session's job; a Ready snapshot for unknown ids
     */
    [[nodiscard]] JobStatus get_status(const std::string& session_id) const;

    /**
     * @return false for a closed session
     */
    bool request_cancel(const std::string& session_id);

    /**
     * @brief Raise the cancel flag of every running job (used at shutdown)
     */
    std::size_t cancel_all();
    /**
     * @return NotFound for a closed session
     */
    Result<void> reset_session(const std::string& session_id);
    bool close_session(const std::string& session_id);

    /**
     * @brief List a source's items and remember them for the next submit
     *
     * @return NotFound when `session_id` names a closed session
     */
    Result<PreviewResult> preview(const std::string& source_ref, const std::string& session_id);

    [[nodiscard]] std::vector<JobRecord> history(const std::string& session_id) const;

    /**
     * @brief Block until every dispatched worker has returned
     */
    void wait_idle();

    [[nodiscard]] std::size_t active_workers();

private:
    void reap_finished_workers();

    SessionStore& store_;
    events::EventBus& event_bus_;
    CancellationController cancellation_;
    PreviewResolver preview_resolver_;
    JobRunner runner_;

    std::mutex workers_mutex_;
    std::vector<std::future<void>> workers_;
};

} // namespace fetchd::jobs
