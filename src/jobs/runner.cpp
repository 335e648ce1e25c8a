#include "fetchd/jobs/runner.hpp"
#include "fetchd/events/events.hpp"
#include "fetchd/jobs/preview.hpp"
#include "fetchd/jobs/progress.hpp"
#include "fetchd/jobs/state_machine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace fetchd::jobs {

JobRunner::JobRunner(SessionStore& store,
                     CancellationController& cancellation,
                     fetch::FetchService& fetch_service,
                     events::EventBus& bus)
    : store_(store),
      cancellation_(cancellation),
      fetch_service_(fetch_service),
      event_bus_(bus) {
}

void JobRunner::run(const JobTicket& ticket) {
    const auto started_at = std::chrono::steady_clock::now();

    try {
        if (auto result = transition(ticket, JobPhase::Processing); result.is_error()) {
            conclude(ticket, result.error());
            return;
        }
        if (auto result = resolve(ticket); result.is_error()) {
            conclude(ticket, result.error());
            return;
        }
        if (auto result = transition(ticket, JobPhase::Starting); result.is_error()) {
            conclude(ticket, result.error());
            return;
        }
        // A cancel raised while metadata was resolving is honoured before any transfer
        if (auto result = cancellation_.check(ticket.session_id); result.is_error()) {
            conclude(ticket, result.error());
            return;
        }
        if (auto result = transfer(ticket); result.is_error()) {
            conclude(ticket, result.error());
            return;
        }
        finish(ticket, started_at);
    } catch (const std::exception& e) {
        spdlog::error("Job for session {} threw: {}", ticket.session_id, e.what());
        conclude(ticket, Error::internal(std::string("Unexpected failure: ") + e.what()));
    }
}

Result<void> JobRunner::resolve(const JobTicket& ticket) {
    PreviewResult listing;

    if (ticket.has_matching_preview()) {
        spdlog::debug("Session {} reuses preview of {}", ticket.session_id, ticket.request.source_ref);
        listing = *ticket.preview;
    } else {
        auto resolved = fetch_service_.resolve_metadata(ticket.request.source_ref, fetch::ResolveMode::Full);
        if (resolved.is_error()) {
            return Err<void>(Error::resolution("Could not fetch info: " + resolved.error().message));
        }
        if (!resolved.value()) {
            return Err<void>(Error::resolution("Could not fetch info: nothing found at " +
                                               ticket.request.source_ref));
        }
        listing = PreviewResolver::from_metadata(ticket.request.source_ref, *resolved.value());
        if (listing.total == 0) {
            return Err<void>(Error::resolution("Could not fetch info: no resolvable items at " +
                                               ticket.request.source_ref));
        }
    }

    return store_.update(ticket.session_id, ticket.generation, [&listing](Session& session) {
        if (!session.job) {
            return;
        }
        auto& job = *session.job;
        ProgressAggregator::revise_total(job, listing.total);
        job.manifest = std::move(listing.manifest);
        if (job.title.empty()) {
            job.title = listing.title;
        }
    });
}

Result<void> JobRunner::transfer(const JobTicket& ticket) {
    fetch::FetchRequest request;
    request.source_ref = ticket.request.source_ref;
    request.kind = ticket.request.kind;
    request.quality = ticket.request.quality;

    bool stale_reported = false;
    return fetch_service_.fetch(request, [this, &ticket, &stale_reported](const fetch::ProgressEvent& event) {
        return on_progress(ticket, event, stale_reported);
    });
}

Result<void> JobRunner::on_progress(const JobTicket& ticket,
                                    const fetch::ProgressEvent& event,
                                    bool& stale_reported) {
    if (auto cancel = cancellation_.check(ticket.session_id); cancel.is_error()) {
        return cancel;
    }

    auto outcome = ProgressAggregator::Outcome::Ignored;
    JobPhase from = JobPhase::Ready;
    JobPhase to = JobPhase::Ready;
    std::size_t completed = 0;
    std::size_t total = 0;

    auto applied = store_.update(ticket.session_id, ticket.generation, [&](Session& session) {
        if (!session.job) {
            return;
        }
        from = session.job->phase;
        outcome = ProgressAggregator::apply(*session.job, session.known_items, event);
        to = session.job->phase;
        completed = session.job->items_completed;
        total = session.job->items_total;
    });

    if (applied.is_error()) {
        // Superseded or removed: keep the transfer alive but stop writing
        if (!stale_reported) {
            stale_reported = true;
            event_bus_.emit(events::StaleUpdateDroppedEvent{ticket.session_id, ticket.generation});
        }
        return Ok();
    }

    if (from != to) {
        event_bus_.emit(events::JobPhaseChangedEvent{ticket.session_id, ticket.generation, from, to});
    }
    if (outcome == ProgressAggregator::Outcome::ItemCompleted ||
        outcome == ProgressAggregator::Outcome::JobCompleted) {
        event_bus_.emit(events::ItemFinishedEvent{ticket.session_id, event.label, completed, total});
    }
    return Ok();
}

Result<void> JobRunner::transition(const JobTicket& ticket, JobPhase next) {
    JobPhase from = JobPhase::Ready;
    std::optional<Error> illegal;

    auto applied = store_.update(ticket.session_id, ticket.generation, [&](Session& session) {
        if (!session.job) {
            illegal = Error::internal("Session " + ticket.session_id + " has no job");
            return;
        }
        from = session.job->phase;
        auto moved = JobStateMachine::transition_to(*session.job, next);
        if (moved.is_error()) {
            illegal = moved.error();
        }
    });

    if (applied.is_error()) {
        return applied;
    }
    if (illegal) {
        return Err<void>(*illegal);
    }
    if (from != next) {
        event_bus_.emit(events::JobPhaseChangedEvent{ticket.session_id, ticket.generation, from, next});
    }
    return Ok();
}

void JobRunner::finish(const JobTicket& ticket, std::chrono::steady_clock::time_point started_at) {
    std::optional<JobRecord> record;
    JobPhase from = JobPhase::Ready;

    auto applied = store_.update(ticket.session_id, ticket.generation, [&](Session& session) {
        if (!session.job) {
            return;
        }
        auto& job = *session.job;
        from = job.phase;
        if (job.phase == JobPhase::Starting &&
            JobStateMachine::transition_to(job, JobPhase::Downloading).is_error()) {
            return;
        }
        if (JobStateMachine::transition_to(job, JobPhase::Finished).is_error()) {
            return;
        }
        job.overall_percent = 100.0;
        job.current_item_label.clear();

        JobRecord entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.source_ref = job.source_ref;
        entry.kind = job.kind;
        entry.quality = job.quality;
        entry.title = job.title;
        entry.item_count = std::max(job.items_total, job.items_completed);
        store_.push_history(session, entry);
        record = std::move(entry);
    });

    if (applied.is_error()) {
        spdlog::debug("Job for session {} finished after being superseded", ticket.session_id);
        return;
    }
    if (!record) {
        spdlog::warn("Job for session {} completed its transfer but could not be marked finished",
                     ticket.session_id);
        return;
    }

    if (from != JobPhase::Finished) {
        event_bus_.emit(events::JobPhaseChangedEvent{ticket.session_id, ticket.generation, from,
                                                     JobPhase::Finished});
    }
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    event_bus_.emit(events::JobFinishedEvent{ticket.session_id, record->source_ref, record->title,
                                             record->item_count, duration});
}

void JobRunner::conclude(const JobTicket& ticket, const Error& error) {
    if (error.is(ErrorKind::Superseded) || error.is(ErrorKind::NotFound)) {
        spdlog::debug("Job for session {} stopped: {}", ticket.session_id, error.message);
        return;
    }

    const bool canceled = error.is(ErrorKind::Canceled);
    JobPhase from = JobPhase::Ready;
    std::size_t completed = 0;
    bool moved = false;

    auto applied = store_.update(ticket.session_id, ticket.generation, [&](Session& session) {
        if (!session.job) {
            return;
        }
        auto& job = *session.job;
        from = job.phase;
        completed = job.items_completed;
        auto result = canceled ? JobStateMachine::mark_canceled(job)
                               : JobStateMachine::mark_failed(job, error.message);
        moved = result.is_ok();
    });

    if (applied.is_error()) {
        spdlog::debug("Dropped outcome of superseded job for session {}: {}", ticket.session_id, error.message);
        return;
    }
    if (!moved) {
        spdlog::warn("Job for session {} ended in {} and ignores late outcome: {}",
                     ticket.session_id, to_string(from), error.message);
        return;
    }

    const JobPhase to = canceled ? JobPhase::Canceled : JobPhase::Error;
    event_bus_.emit(events::JobPhaseChangedEvent{ticket.session_id, ticket.generation, from, to});
    if (canceled) {
        event_bus_.emit(events::JobCanceledEvent{ticket.session_id, ticket.request.source_ref, completed});
    } else {
        event_bus_.emit(events::JobFailedEvent{ticket.session_id, ticket.request.source_ref, error.message});
    }
}

} // namespace fetchd::jobs
