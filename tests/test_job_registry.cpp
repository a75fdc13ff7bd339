#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "scheduler/job_registry.hpp"
#include "scheduler/scheduler_error.hpp"

using namespace std::chrono_literals;

class JobRegistryTest : public ::testing::Test {
protected:
    JobId add(JobTimePoint submittedAt = JobClock::now()) {
        JobRecord rec;
        rec.id           = JobId::generate();
        rec.submitted_at = submittedAt;
        registry_.insert(rec, JobHandle::create());
        return rec.id;
    }

    JobRegistry registry_;
};

TEST_F(JobRegistryTest, InsertAndLookup) {
    auto id = add();
    EXPECT_TRUE(registry_.contains(id));
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.status(id), JobStatus::Pending);
    EXPECT_EQ(registry_.record(id).id, id);
}

TEST_F(JobRegistryTest, DuplicateIdRejected) {
    auto id = add();
    JobRecord dup;
    dup.id = id;
    try {
        registry_.insert(dup, JobHandle::create());
        FAIL() << "expected AlreadyScheduled";
    } catch (const SchedulerError& e) {
        EXPECT_EQ(e.code(), SchedulerErrc::AlreadyScheduled);
    }
}

TEST_F(JobRegistryTest, UnknownIdIsNotFound) {
    auto unknown = JobId::generate();
    for (auto fn : std::vector<std::function<void()>>{
             [&] { registry_.record(unknown); },
             [&] { registry_.status(unknown); },
             [&] { registry_.handle(unknown); },
             [&] { registry_.result(unknown); },
             [&] { registry_.erase(unknown); }}) {
        try {
            fn();
            FAIL() << "expected NotFound";
        } catch (const SchedulerError& e) {
            EXPECT_EQ(e.code(), SchedulerErrc::NotFound);
        }
    }
    EXPECT_FALSE(registry_.markRunning(unknown));
}

TEST_F(JobRegistryTest, CompletedLifecycleSetsTimestampsInOrder) {
    auto id = add();
    ASSERT_TRUE(registry_.markRunning(id));
    ASSERT_TRUE(registry_.markCompleted(id, JobResult(7)));

    auto rec = registry_.record(id);
    EXPECT_EQ(rec.status, JobStatus::Completed);
    ASSERT_TRUE(rec.started_at.has_value());
    ASSERT_TRUE(rec.finished_at.has_value());
    EXPECT_LE(rec.submitted_at, *rec.started_at);
    EXPECT_LE(*rec.started_at, *rec.finished_at);
    EXPECT_FALSE(rec.error.has_value());
    EXPECT_EQ(std::any_cast<int>(registry_.result(id)), 7);
}

TEST_F(JobRegistryTest, TerminalStateIsFinal) {
    auto id = add();
    ASSERT_TRUE(registry_.markRunning(id));
    ASSERT_TRUE(registry_.markFailed(id, "std::runtime_error: x", "trace"));
    auto first = registry_.record(id);

    EXPECT_FALSE(registry_.markCompleted(id, JobResult(1)));
    EXPECT_FALSE(registry_.markCanceled(id));
    EXPECT_FALSE(registry_.markFailed(id, "other", "other"));

    auto after = registry_.record(id);
    EXPECT_EQ(after.status, JobStatus::Failed);
    EXPECT_EQ(after.error, first.error);
    EXPECT_EQ(after.finished_at, first.finished_at);
}

TEST_F(JobRegistryTest, FailedResultRethrowsCapturedFailure) {
    auto id = add();
    registry_.markRunning(id);
    registry_.markFailed(id, "std::invalid_argument: boom", "Traceback:\n  boom\n");
    try {
        registry_.result(id);
        FAIL() << "expected JobFailureError";
    } catch (const JobFailureError& e) {
        EXPECT_EQ(e.code(), SchedulerErrc::JobFailure);
        EXPECT_EQ(e.error(), "std::invalid_argument: boom");
        EXPECT_FALSE(e.traceback().empty());
    }
}

TEST_F(JobRegistryTest, ResultBeforeCompletionIsNotFinished) {
    auto id = add();
    try {
        registry_.result(id);
        FAIL() << "expected NotFinished";
    } catch (const SchedulerError& e) {
        EXPECT_EQ(e.code(), SchedulerErrc::NotFinished);
    }
}

TEST_F(JobRegistryTest, CancelIfPendingOnlyAffectsPending) {
    auto pending = add();
    EXPECT_TRUE(registry_.markCanceledIfPending(pending));
    auto rec = registry_.record(pending);
    EXPECT_EQ(rec.status, JobStatus::Canceled);
    EXPECT_FALSE(rec.started_at.has_value());
    EXPECT_TRUE(rec.finished_at.has_value());

    auto running = add();
    registry_.markRunning(running);
    EXPECT_FALSE(registry_.markCanceledIfPending(running));
    EXPECT_EQ(registry_.status(running), JobStatus::Running);
}

TEST_F(JobRegistryTest, JobIdResultBecomesArtifact) {
    auto id = add();
    auto artifact = JobId::generate();
    registry_.markRunning(id);
    registry_.markCompleted(id, JobResult(artifact));
    auto rec = registry_.record(id);
    ASSERT_TRUE(rec.artifact_id.has_value());
    EXPECT_EQ(*rec.artifact_id, artifact);
}

TEST_F(JobRegistryTest, TerminalTransitionResolvesDoneFuture) {
    auto id = add();
    auto handle = registry_.handle(id);
    EXPECT_EQ(handle.done.wait_for(0ms), std::future_status::timeout);
    registry_.markRunning(id);
    EXPECT_EQ(handle.done.wait_for(0ms), std::future_status::timeout);
    registry_.markCanceled(id);
    EXPECT_EQ(handle.done.wait_for(0ms), std::future_status::ready);
}

TEST_F(JobRegistryTest, SnapshotNewestFirstWithFilter) {
    auto base = JobClock::now();
    auto a = add(base);
    auto b = add(base + 1ms);
    auto c = add(base + 2ms);
    registry_.markRunning(b);

    auto all = registry_.snapshot();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, c);
    EXPECT_EQ(all[1].id, b);
    EXPECT_EQ(all[2].id, a);

    auto running = registry_.snapshot(JobStatus::Running);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].id, b);

    EXPECT_EQ(registry_.unfinished().size(), 3u);
}

TEST_F(JobRegistryTest, SameSubmissionTimeOrderedById) {
    auto t = JobClock::now();
    auto a = add(t);
    auto b = add(t);
    auto all = registry_.snapshot();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, b);
    EXPECT_EQ(all[1].id, a);
}

TEST_F(JobRegistryTest, EraseRemovesEverything) {
    auto id = add();
    registry_.erase(id);
    EXPECT_FALSE(registry_.contains(id));
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_FALSE(registry_.markRunning(id));
}

TEST_F(JobRegistryTest, LifecycleCallbacksSeeEveryEvent) {
    std::vector<std::pair<JobEvent, JobStatus>> events;
    std::mutex m;
    registry_.addLifecycleCb([&](JobEvent ev, const JobRecord& rec) {
        std::lock_guard lg(m);
        events.emplace_back(ev, rec.status);
    });
    // 回调抛异常不影响状态迁移
    registry_.addLifecycleCb([](JobEvent, const JobRecord&) {
        throw std::runtime_error("callback failure");
    });

    auto id = add();
    registry_.markRunning(id);
    registry_.markCompleted(id, JobResult{});
    registry_.erase(id);

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0], std::make_pair(JobEvent::Submitted, JobStatus::Pending));
    EXPECT_EQ(events[1], std::make_pair(JobEvent::Started, JobStatus::Running));
    EXPECT_EQ(events[2], std::make_pair(JobEvent::Finished, JobStatus::Completed));
    EXPECT_EQ(events[3].first, JobEvent::Removed);
    EXPECT_STREQ(to_string(JobEvent::Finished), "finished");
}

TEST_F(JobRegistryTest, NonStandardThrowFromCallbackStillResolvesDone) {
    registry_.addLifecycleCb([](JobEvent ev, const JobRecord&) {
        if (ev == JobEvent::Finished) throw 42;
    });
    auto id = add();
    auto handle = registry_.handle(id);
    EXPECT_TRUE(registry_.markRunning(id));
    EXPECT_TRUE(registry_.markCompleted(id, JobResult{1}));
    EXPECT_EQ(handle.done.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(registry_.status(id), JobStatus::Completed);
}

TEST_F(JobRegistryTest, FinishedCallbackRunsBeforeWaitersRelease) {
    std::atomic<bool> doneSeenInCallback{true};
    registry_.addLifecycleCb([this, &doneSeenInCallback](JobEvent ev, const JobRecord& rec) {
        if (ev != JobEvent::Finished) return;
        auto handle = registry_.handle(rec.id);
        doneSeenInCallback = handle.done.wait_for(0ms) == std::future_status::ready;
    });
    auto id = add();
    auto handle = registry_.handle(id);
    registry_.markCanceled(id);
    EXPECT_FALSE(doneSeenInCallback.load());
    EXPECT_EQ(handle.done.wait_for(0ms), std::future_status::ready);
}

TEST_F(JobRegistryTest, ConcurrentTransitionsHaveSingleWinner) {
    auto id = add();
    registry_.markRunning(id);

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            bool ok = (i % 2 == 0) ? registry_.markCompleted(id, JobResult(i))
                                   : registry_.markCanceled(id);
            if (ok) ++winners;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(isTerminal(registry_.status(id)));
}
