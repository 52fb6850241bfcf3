#include <gtest/gtest.h>

#include <omnifetch/scheduler/job_scheduler.h>

#include "../../common/test_helpers.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace omnifetch;
using namespace omnifetch::scheduler;
using namespace std::chrono_literals;

namespace {

// Tracks how many executors run at once
struct ActiveCounter {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    int enter() {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        return now;
    }
    void leave() { --active; }
};

// Executor body that blocks until the gate opens or the job is cancelled
JobOutcome waitForGate(const std::atomic<bool>& gate, const CancellationToken& token) {
    while (!gate.load()) {
        if (token.waitFor(2ms))
            return JobOutcome::Cancelled;
    }
    return JobOutcome::Completed;
}

} // namespace

TEST(JobSchedulerTest, DispatchesByPriorityThenSubmissionOrder) {
    std::mutex mu;
    std::vector<JobId> order;
    JobScheduler sched(1, [&](const JobId& id, const CancellationToken&) {
        std::lock_guard lk(mu);
        order.push_back(id);
        return JobOutcome::Completed;
    });

    sched.pauseQueue();
    ASSERT_TRUE(sched.submit("a", 0));
    ASSERT_TRUE(sched.submit("b", 5));
    ASSERT_TRUE(sched.submit("c", 0));
    ASSERT_TRUE(sched.submit("d", 5));
    ASSERT_TRUE(sched.submit("e", -1));
    EXPECT_EQ(sched.queuedJobs(), (std::vector<JobId>{"b", "d", "a", "c", "e"}));
    EXPECT_TRUE(sched.status().paused);
    EXPECT_TRUE(sched.isQueued("a"));

    sched.resumeQueue();
    ASSERT_TRUE(sched.waitIdle(5s));
    std::lock_guard lk(mu);
    EXPECT_EQ(order, (std::vector<JobId>{"b", "d", "a", "c", "e"}));
}

TEST(JobSchedulerTest, NeverExceedsConcurrencyLimit) {
    ActiveCounter counter;
    JobScheduler sched(3, [&](const JobId&, const CancellationToken&) {
        counter.enter();
        std::this_thread::sleep_for(15ms);
        counter.leave();
        return JobOutcome::Completed;
    });

    for (int i = 0; i < 12; ++i) {
        ASSERT_TRUE(sched.submit("job-" + std::to_string(i)));
    }
    ASSERT_TRUE(sched.waitIdle(10s));
    EXPECT_LE(counter.peak.load(), 3);
    EXPECT_GE(counter.peak.load(), 1);

    auto st = sched.status();
    EXPECT_EQ(st.completed, 12u);
    EXPECT_EQ(st.queued, 0u);
    EXPECT_EQ(st.running, 0u);
    EXPECT_EQ(st.concurrencyLimit, 3);
}

TEST(JobSchedulerTest, LoweringLimitLetsRunningJobsFinish) {
    std::atomic<bool> gate{false};
    ActiveCounter counter;
    std::atomic<int> lateStartConcurrency{0};
    JobScheduler sched(3, [&](const JobId& id, const CancellationToken& token) {
        const int now = counter.enter();
        if (id == "late-1" || id == "late-2") {
            lateStartConcurrency = std::max(lateStartConcurrency.load(), now);
            std::this_thread::sleep_for(5ms);
            counter.leave();
            return JobOutcome::Completed;
        }
        auto outcome = waitForGate(gate, token);
        counter.leave();
        return outcome;
    });

    for (const auto* id : {"early-1", "early-2", "early-3", "late-1", "late-2"}) {
        ASSERT_TRUE(sched.submit(id));
    }
    ASSERT_TRUE(tests::wait_until([&] { return sched.status().running == 3; }));
    ASSERT_TRUE(sched.setConcurrency(1));
    EXPECT_EQ(sched.status().running, 3u);

    gate = true;
    ASSERT_TRUE(sched.waitIdle(5s));
    auto st = sched.status();
    EXPECT_EQ(st.completed, 5u);
    EXPECT_EQ(st.cancelled, 0u);
    EXPECT_EQ(lateStartConcurrency.load(), 1);
}

TEST(JobSchedulerTest, CancelQueuedAndRunning) {
    std::atomic<bool> gate{false};
    std::mutex mu;
    std::vector<JobId> started;
    JobScheduler sched(1, [&](const JobId& id, const CancellationToken& token) {
        {
            std::lock_guard lk(mu);
            started.push_back(id);
        }
        return waitForGate(gate, token);
    });

    ASSERT_TRUE(sched.submit("runner"));
    ASSERT_TRUE(tests::wait_until([&] { return sched.isRunning("runner"); }));
    ASSERT_TRUE(sched.submit("waiter"));

    EXPECT_EQ(sched.cancel("waiter"), CancelResult::RemovedFromQueue);
    EXPECT_FALSE(sched.isQueued("waiter"));
    EXPECT_EQ(sched.cancel("runner"), CancelResult::CancelledRunning);
    EXPECT_FALSE(sched.isRunning("runner"));
    EXPECT_EQ(sched.cancel("ghost"), CancelResult::NotFound);

    ASSERT_TRUE(sched.waitIdle(2s));
    EXPECT_EQ(sched.status().cancelled, 1u);
    std::lock_guard lk(mu);
    EXPECT_EQ(started, std::vector<JobId>{"runner"});
}

TEST(JobSchedulerTest, RejectsDuplicatesAndBadLimits) {
    JobScheduler sched(2, [](const JobId&, const CancellationToken&) {
        return JobOutcome::Completed;
    });
    sched.pauseQueue();
    ASSERT_TRUE(sched.submit("x"));
    auto dup = sched.submit("x");
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::AlreadyExists);

    auto zero = sched.setConcurrency(0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidArgument);

    ASSERT_TRUE(sched.setConcurrency(4));
    auto st = sched.status();
    EXPECT_EQ(st.concurrencyLimit, 4);
    EXPECT_EQ(st.workerThreads, 4u);
    EXPECT_EQ(st.queued, 1u);
}

TEST(JobSchedulerTest, ThrowingExecutorCountsAsFailed) {
    JobScheduler sched(1, [](const JobId& id, const CancellationToken&) -> JobOutcome {
        if (id == "bad")
            throw std::runtime_error("exploded");
        return JobOutcome::Completed;
    });
    ASSERT_TRUE(sched.submit("bad"));
    ASSERT_TRUE(sched.submit("good"));
    ASSERT_TRUE(sched.waitIdle(5s));
    auto st = sched.status();
    EXPECT_EQ(st.failed, 1u);
    EXPECT_EQ(st.completed, 1u);
}

TEST(JobSchedulerTest, ShutdownCancelsRunningAndRejectsNewWork) {
    std::atomic<bool> gate{false};
    JobScheduler sched(2, [&](const JobId&, const CancellationToken& token) {
        return waitForGate(gate, token);
    });
    ASSERT_TRUE(sched.submit("one"));
    ASSERT_TRUE(tests::wait_until([&] { return sched.isRunning("one"); }));
    sched.pauseQueue();
    ASSERT_TRUE(sched.submit("two"));

    sched.shutdown();
    auto st = sched.status();
    EXPECT_EQ(st.cancelled, 1u);
    EXPECT_EQ(st.queued, 0u);
    EXPECT_EQ(st.running, 0u);

    auto late = sched.submit("three");
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, ErrorCode::InvalidState);
    sched.shutdown();
}
