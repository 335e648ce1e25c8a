/**
 * @file components.hpp
 * @brief Event subscribers for logging and job statistics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "fetchd/events/event_bus.hpp"
#include "fetchd/events/events.hpp"

#include <atomic>
#include <cstdint>

#include <spdlog/spdlog.h>

namespace fetchd::events {

/**
 * @brief Logs every job lifecycle event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("fetchd listening on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("fetchd shutting down: {}", e.reason);
        });

        bus_.subscribe<JobSubmittedEvent>([](const JobSubmittedEvent& e) {
            spdlog::info("[JobSubmitted] session={} gen={} kind={} fast_path={} source={}",
                         e.session_id, e.generation, jobs::to_string(e.kind), e.fast_path, e.source_ref);
        });

        bus_.subscribe<JobPhaseChangedEvent>([](const JobPhaseChangedEvent& e) {
            spdlog::debug("[JobPhase] session={} gen={} {} -> {}",
                          e.session_id, e.generation, jobs::to_string(e.from), jobs::to_string(e.to));
        });

        bus_.subscribe<ItemFinishedEvent>([](const ItemFinishedEvent& e) {
            spdlog::info("[ItemFinished] session={} item={}/{} label={}",
                         e.session_id, e.items_completed, e.items_total, e.label);
        });

        bus_.subscribe<JobFinishedEvent>([](const JobFinishedEvent& e) {
            spdlog::info("[JobFinished] session={} items={} duration={}ms title={}",
                         e.session_id, e.item_count, e.duration.count(), e.title);
        });

        bus_.subscribe<JobCanceledEvent>([](const JobCanceledEvent& e) {
            spdlog::info("[JobCanceled] session={} after {} item(s) source={}",
                         e.session_id, e.items_completed, e.source_ref);
        });

        bus_.subscribe<JobFailedEvent>([](const JobFailedEvent& e) {
            spdlog::warn("[JobFailed] session={} source={} error={}",
                         e.session_id, e.source_ref, e.error_message);
        });

        bus_.subscribe<StaleUpdateDroppedEvent>([](const StaleUpdateDroppedEvent& e) {
            spdlog::debug("[StaleUpdate] session={} dropped write from generation {}",
                          e.session_id, e.stale_generation);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts job outcomes for the /health endpoint and shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> jobs_submitted{0};
        std::atomic<uint64_t> fast_path_jobs{0};
        std::atomic<uint64_t> jobs_finished{0};
        std::atomic<uint64_t> jobs_canceled{0};
        std::atomic<uint64_t> jobs_failed{0};
        std::atomic<uint64_t> items_finished{0};
        std::atomic<uint64_t> stale_updates_dropped{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<JobSubmittedEvent>([this](const JobSubmittedEvent& e) {
            stats_.jobs_submitted++;
            if (e.fast_path) {
                stats_.fast_path_jobs++;
            }
        });

        bus_.subscribe<ItemFinishedEvent>([this](const ItemFinishedEvent&) {
            stats_.items_finished++;
        });

        bus_.subscribe<JobFinishedEvent>([this](const JobFinishedEvent&) {
            stats_.jobs_finished++;
        });

        bus_.subscribe<JobCanceledEvent>([this](const JobCanceledEvent&) {
            stats_.jobs_canceled++;
        });

        bus_.subscribe<JobFailedEvent>([this](const JobFailedEvent&) {
            stats_.jobs_failed++;
        });

        bus_.subscribe<StaleUpdateDroppedEvent>([this](const StaleUpdateDroppedEvent&) {
            stats_.stale_updates_dropped++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Job statistics:");
        spdlog::info("  Submitted:       {}", stats_.jobs_submitted.load());
        spdlog::info("  Fast path:       {}", stats_.fast_path_jobs.load());
        spdlog::info("  Finished:        {}", stats_.jobs_finished.load());
        spdlog::info("  Canceled:        {}", stats_.jobs_canceled.load());
        spdlog::info("  Failed:          {}", stats_.jobs_failed.load());
        spdlog::info("  Items fetched:   {}", stats_.items_finished.load());
        spdlog::info("  Stale updates:   {}", stats_.stale_updates_dropped.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace fetchd::events
