#include "fetchd/jobs/session_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using fetchd::ErrorKind;
using fetchd::jobs::JobPhase;
using fetchd::jobs::JobRecord;
using fetchd::jobs::JobState;
using fetchd::jobs::PreviewResult;
using fetchd::jobs::Session;
using fetchd::jobs::SessionStore;

namespace {

JobRecord record(const std::string& title) {
    JobRecord entry;
    entry.title = title;
    entry.item_count = 1;
    return entry;
}

} // namespace

TEST(SessionStoreTest, GetOrCreateIssuesFreshIds) {
    SessionStore store;

    auto first = store.get_or_create();
    auto second = store.get_or_create();

    EXPECT_EQ(first.id.size(), 32u);
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get_or_create(first.id).id, first.id);
    EXPECT_EQ(store.size(), 2u);
}

TEST(SessionStoreTest, GetUnknownSessionIsEmpty) {
    SessionStore store;
    EXPECT_FALSE(store.get("nope").has_value());
}

TEST(SessionStoreTest, ResetBumpsGenerationAndPreservesHistory) {
    SessionStore store;
    auto id = store.get_or_create().id;

    auto gen = store.reset(id).value();
    ASSERT_TRUE(store.update(id, gen, [](Session& s) {
        s.job = JobState{};
        s.known_items.insert("Track 1");
        s.cancel_requested = true;
    }).is_ok());
    ASSERT_TRUE(store.append_history(id, gen, record("first")).is_ok());
    store.store_preview(id, PreviewResult{"src", "title", 1, {}});

    auto next = store.reset(id).value();
    EXPECT_EQ(next, gen + 1);

    auto session = store.get(id);
    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session->job.has_value());
    EXPECT_FALSE(session->cancel_requested);
    EXPECT_FALSE(session->preview.has_value());
    EXPECT_EQ(session->history.size(), 1u);
    EXPECT_EQ(session->known_items.count("Track 1"), 1u);
}

TEST(SessionStoreTest, StaleGenerationIsRejected) {
    SessionStore store;
    auto id = store.get_or_create().id;
    auto old_gen = store.reset(id).value();
    store.reset(id);

    bool ran = false;
    auto result = store.update(id, old_gen, [&ran](Session&) { ran = true; });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Superseded);
    EXPECT_FALSE(ran);
}

TEST(SessionStoreTest, UpdateOfUnknownSessionIsNotFound) {
    SessionStore store;
    auto result = store.update("ghost", 0, [](Session&) {});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST(SessionStoreTest, RemovedIdsAreNeverReused) {
    SessionStore store;
    auto id = store.get_or_create().id;

    EXPECT_TRUE(store.remove(id));
    EXPECT_FALSE(store.remove(id));
    EXPECT_FALSE(store.get(id).has_value());

    auto replacement = store.get_or_create(id);
    EXPECT_NE(replacement.id, id);
}

TEST(SessionStoreTest, RemovedIdCannotBeRevivedByWriters) {
    SessionStore store;
    auto id = store.get_or_create().id;
    ASSERT_TRUE(store.remove(id));

    auto reset = store.reset(id);
    ASSERT_TRUE(reset.is_error());
    EXPECT_EQ(reset.error().kind, ErrorKind::NotFound);
    EXPECT_FALSE(store.arm_cancel(id));
    EXPECT_FALSE(store.store_preview(id, PreviewResult{"src", "t", 1, {}}));

    EXPECT_FALSE(store.get(id).has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(SessionStoreTest, ArmCancelCreatesUnknownSession) {
    SessionStore store;

    EXPECT_TRUE(store.arm_cancel("fresh"));

    auto session = store.get("fresh");
    ASSERT_TRUE(session.has_value());
    EXPECT_TRUE(session->cancel_requested);
}

TEST(SessionStoreTest, HistoryIsBoundedOldestFirst) {
    SessionStore store(3);
    auto id = store.get_or_create().id;
    auto gen = store.reset(id).value();

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.append_history(id, gen, record("job-" + std::to_string(i))).is_ok());
    }

    auto history = store.history(id);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().title, "job-2");
    EXPECT_EQ(history.back().title, "job-4");
}

TEST(SessionStoreTest, TakePreviewEmptiesTheSlot) {
    SessionStore store;
    auto id = store.get_or_create().id;
    store.store_preview(id, PreviewResult{"src", "t", 2, {}});

    auto taken = store.take_preview(id);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->total, 2u);
    EXPECT_FALSE(store.take_preview(id).has_value());
}

TEST(SessionStoreTest, CancelAllOnlyFlagsRunningJobs) {
    SessionStore store;
    auto running = store.get_or_create().id;
    auto done = store.get_or_create().id;
    auto idle = store.get_or_create().id;

    auto gen_running = store.reset(running).value();
    ASSERT_TRUE(store.update(running, gen_running, [](Session& s) {
        s.job = JobState{};
        s.job->phase = JobPhase::Downloading;
    }).is_ok());
    auto gen_done = store.reset(done).value();
    ASSERT_TRUE(store.update(done, gen_done, [](Session& s) {
        s.job = JobState{};
        s.job->phase = JobPhase::Finished;
    }).is_ok());

    EXPECT_EQ(store.cancel_all(), 1u);
    EXPECT_TRUE(store.is_cancel_requested(running));
    EXPECT_FALSE(store.is_cancel_requested(done));
    EXPECT_FALSE(store.is_cancel_requested(idle));
}

TEST(SessionStoreTest, ReadersNeverSeeHalfAppliedUpdates) {
    SessionStore store;
    auto id = store.get_or_create().id;
    auto gen = store.reset(id).value();
    ASSERT_TRUE(store.update(id, gen, [](Session& s) { s.job = JobState{}; }).is_ok());

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        while (!stop) {
            auto session = store.get(id);
            if (session && session->job &&
                session->job->items_completed * 10 != static_cast<std::size_t>(session->job->overall_percent)) {
                torn++;
            }
        }
    });

    for (std::size_t i = 1; i <= 200; ++i) {
        ASSERT_TRUE(store.update(id, gen, [i](Session& s) {
            s.job->items_completed = i;
            s.job->overall_percent = static_cast<double>(i * 10);
        }).is_ok());
    }
    stop = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
}
