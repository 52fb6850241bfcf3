#pragma once

#include <omnifetch/core/cancellation.h>
#include <omnifetch/core/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace omnifetch::scheduler {

/**
 * How an executed job ended, as reported by the executor.
 */
enum class JobOutcome { Completed, Cancelled, Failed };

/**
 * Runs one job to a terminal outcome on a worker thread. Must observe `token` cooperatively.
 */
using JobExecutor = std::function<JobOutcome(const JobId& id, const CancellationToken& token)>;

enum class CancelResult {
    NotFound,         // neither queued nor running
    RemovedFromQueue, // had not started; dropped with no side effects
    CancelledRunning  // was running; the executor has returned
};

struct SchedulerStatus {
    std::size_t queued{0};
    std::size_t running{0};
    int concurrencyLimit{0};
    std::size_t workerThreads{0};
    bool paused{false};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t cancelled{0};
};

/**
 * Bounded worker pool over a priority queue.
 *
 * Dispatch order: higher priority first, FIFO by enqueue order within a priority. A worker
 * takes a job only while fewer than `concurrencyLimit` jobs run, so lowering the limit lets
 * running jobs finish and holds back new dispatch until the count drops below it.
 */
class JobScheduler {
public:
    JobScheduler(int concurrency, JobExecutor executor);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * Enqueue `id`. AlreadyExists if it is queued or running; InvalidState after shutdown().
     */
    Result<void> submit(const JobId& id, int priority = 0);

    /**
     * Remove a queued job, or cancel a running one and block until its executor returns.
     * Must not be called from the executor of the same job.
     */
    CancelResult cancel(const JobId& id);

    /**
     * Change the number of execution slots. InvalidArgument when n < 1.
     */
    Result<void> setConcurrency(int n);

    /**
     * Stop dispatching new jobs; running jobs continue.
     */
    void pauseQueue();
    void resumeQueue();

    [[nodiscard]] SchedulerStatus status() const;
    [[nodiscard]] bool isQueued(const JobId& id) const;
    [[nodiscard]] bool isRunning(const JobId& id) const;

    /**
     * Queued job ids in dispatch order.
     */
    [[nodiscard]] std::vector<JobId> queuedJobs() const;

    /**
     * Block until nothing is queued or running, or `timeout` elapses.
     * @return true when idle
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /**
     * Drop queued jobs, cancel running ones, and join the workers. Idempotent.
     */
    void shutdown();

private:
    struct Entry {
        int priority;
        std::uint64_t sequence;
        JobId id;

        bool operator<(const Entry& other) const {
            if (priority != other.priority)
                return priority > other.priority;
            return sequence < other.sequence;
        }
    };

    void workerLoop();
    void growWorkersLocked();
    [[nodiscard]] bool canDispatchLocked() const;

    JobExecutor executor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;     // workers: dispatch possible or stopping
    std::condition_variable doneCv_; // cancel()/waitIdle(): a job finished
    std::set<Entry> queue_;
    std::unordered_map<JobId, std::set<Entry>::iterator> queued_;
    std::unordered_map<JobId, CancellationToken> running_;
    std::uint64_t nextSequence_{0};
    int limit_{1};
    bool paused_{false};
    bool stopping_{false};
    std::uint64_t completed_{0};
    std::uint64_t failed_{0};
    std::uint64_t cancelled_{0};

    std::vector<std::thread> workers_;
};

const char* to_string(JobOutcome outcome);

} // namespace omnifetch::scheduler
