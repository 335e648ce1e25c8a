#include "fetchd/events/event_bus.hpp"
#include "fetchd/events/components.hpp"
#include "fetchd/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using fetchd::events::EventBus;
using fetchd::events::ItemFinishedEvent;
using fetchd::events::JobCanceledEvent;
using fetchd::events::JobFailedEvent;
using fetchd::events::JobFinishedEvent;
using fetchd::events::JobSubmittedEvent;
using fetchd::events::MetricsComponent;
using fetchd::events::StaleUpdateDroppedEvent;
using fetchd::jobs::MediaKind;

TEST(MetricsComponentTest, TracksJobOutcomeCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(JobSubmittedEvent{"session-1", 1, "https://example.test/a", MediaKind::Video, false});
    bus.emit(JobSubmittedEvent{"session-2", 1, "https://example.test/b", MediaKind::Audio, true});
    bus.emit(ItemFinishedEvent{"session-1", "Clip", 1, 1});
    bus.emit(JobFinishedEvent{"session-1", "https://example.test/a", "Clip", 1, std::chrono::milliseconds{200}});
    bus.emit(JobCanceledEvent{"session-2", "https://example.test/b", 0});
    bus.emit(JobFailedEvent{"session-3", "https://example.test/c", "HTTP Error 404"});
    bus.emit(StaleUpdateDroppedEvent{"session-2", 1});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.jobs_submitted.load(), 2u);
    EXPECT_EQ(stats.fast_path_jobs.load(), 1u);
    EXPECT_EQ(stats.items_finished.load(), 1u);
    EXPECT_EQ(stats.jobs_finished.load(), 1u);
    EXPECT_EQ(stats.jobs_canceled.load(), 1u);
    EXPECT_EQ(stats.jobs_failed.load(), 1u);
    EXPECT_EQ(stats.stale_updates_dropped.load(), 1u);
}

TEST(MetricsComponentTest, StartsAtZero) {
    EventBus bus;
    MetricsComponent metrics(bus);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.jobs_submitted.load(), 0u);
    EXPECT_EQ(stats.jobs_finished.load(), 0u);
    EXPECT_NO_THROW(metrics.print_stats());
}
