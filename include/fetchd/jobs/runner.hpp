#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/events/event_bus.hpp"
#include "fetchd/fetch/fetch_service.hpp"
#include "fetchd/jobs/cancellation.hpp"
#include "fetchd/jobs/session_store.hpp"
#include "fetchd/jobs/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fetchd::jobs {

/**
 * @brief Everything a worker needs to run one job
 *
 * `generation` is the value SessionStore::reset() returned when the job was
 * submitted; every write the worker makes is tagged with it.
 */
struct JobTicket {
    std::string session_id;
    std::uint64_t generation = 0;
    JobRequest request;
    std::optional<PreviewResult> preview;

    [[nodiscard]] bool has_matching_preview() const noexcept {
        return preview && preview->total > 0 && preview->source_ref == request.source_ref;
    }
};

/**
 * @brief Drives one job from Processing to a terminal phase
 *
 * LIFECYCLE:
 * 1. Processing: seed the manifest from a matching preview (fast path) or
 *    resolve full metadata (slow path)
 * 2. Starting: honour an early cancel, then hand control to the collaborator
 * 3. Downloading: every progress event goes through the cancel check and
 *    the ProgressAggregator inside SessionStore::update
 * 4. Finished / Canceled / Error
 *
 * run() blocks for the whole transfer and never throws; it is meant to be the
 * body of a background worker.
 */
class JobRunner {
public:
    JobRunner(SessionStore& store,
              CancellationController& cancellation,
              fetch::FetchService& fetch_service,
              events::EventBus& bus);

    void run(const JobTicket& ticket);

private:
    Result<void> resolve(const JobTicket& ticket);
    Result<void> transfer(const JobTicket& ticket);
    Result<void> on_progress(const JobTicket& ticket,
                             const fetch::ProgressEvent& event,
                             bool& stale_reported);

    Result<void> transition(const JobTicket& ticket, JobPhase next);
    void finish(const JobTicket& ticket, std::chrono::steady_clock::time_point started_at);
    void conclude(const JobTicket& ticket, const Error& error);

    SessionStore& store_;
    CancellationController& cancellation_;
    fetch::FetchService& fetch_service_;
    events::EventBus& event_bus_;
};

} // namespace fetchd::jobs
