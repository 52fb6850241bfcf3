#include <omnifetch/scheduler/job_scheduler.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace omnifetch::scheduler {

const char* to_string(JobOutcome outcome) {
    switch (outcome) {
        case JobOutcome::Completed:
            return "completed";
        case JobOutcome::Cancelled:
            return "cancelled";
        case JobOutcome::Failed:
            return "failed";
    }
    return "failed";
}

JobScheduler::JobScheduler(int concurrency, JobExecutor executor)
    : executor_(std::move(executor)), limit_(concurrency < 1 ? 1 : concurrency) {
    std::lock_guard lock(mutex_);
    growWorkersLocked();
    spdlog::debug("JobScheduler started with {} slots", limit_);
}

JobScheduler::~JobScheduler() {
    shutdown();
}

void JobScheduler::growWorkersLocked() {
    while (workers_.size() < static_cast<std::size_t>(limit_)) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

bool JobScheduler::canDispatchLocked() const {
    return !paused_ && !queue_.empty() && running_.size() < static_cast<std::size_t>(limit_);
}

void JobScheduler::workerLoop() {
    while (true) {
        JobId id;
        CancellationToken token;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || canDispatchLocked(); });
            if (stopping_) {
                return;
            }

            auto it = queue_.begin();
            id = it->id;
            queued_.erase(id);
            queue_.erase(it);
            running_.emplace(id, token);
            spdlog::debug("Dispatching job {} ({} running, limit {})", id, running_.size(),
                          limit_);
        }

        JobOutcome outcome = JobOutcome::Failed;
        try {
            outcome = executor_(id, token);
        } catch (const std::exception& e) {
            spdlog::error("Executor threw for job {}: {}", id, e.what());
            outcome = JobOutcome::Failed;
        }

        {
            std::lock_guard lock(mutex_);
            running_.erase(id);
            switch (outcome) {
                case JobOutcome::Completed:
                    ++completed_;
                    break;
                case JobOutcome::Cancelled:
                    ++cancelled_;
                    break;
                case JobOutcome::Failed:
                    ++failed_;
                    break;
            }
        }
        // A slot freed up: another worker may dispatch, and cancel()/waitIdle() may return
        cv_.notify_all();
        doneCv_.notify_all();
    }
}

Result<void> JobScheduler::submit(const JobId& id, int priority) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return Error{ErrorCode::InvalidState, "Scheduler is shut down"};
        }
        if (queued_.count(id) != 0 || running_.count(id) != 0) {
            return Error{ErrorCode::AlreadyExists, "Job already scheduled: " + id};
        }
        auto [it, inserted] = queue_.insert(Entry{priority, nextSequence_++, id});
        queued_.emplace(id, it);
        spdlog::debug("Queued job {} (priority {}, {} waiting)", id, priority, queue_.size());
    }
    cv_.notify_one();
    return {};
}

CancelResult JobScheduler::cancel(const JobId& id) {
    std::unique_lock lock(mutex_);
    if (auto q = queued_.find(id); q != queued_.end()) {
        queue_.erase(q->second);
        queued_.erase(q);
        spdlog::debug("Removed queued job {}", id);
        return CancelResult::RemovedFromQueue;
    }
    auto r = running_.find(id);
    if (r == running_.end()) {
        return CancelResult::NotFound;
    }
    r->second.requestCancel();
    spdlog::debug("Cancellation requested for running job {}", id);
    doneCv_.wait(lock, [&] { return running_.count(id) == 0; });
    return CancelResult::CancelledRunning;
}

Result<void> JobScheduler::setConcurrency(int n) {
    if (n < 1) {
        return Error{ErrorCode::InvalidArgument, "Concurrency must be at least 1"};
    }
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return Error{ErrorCode::InvalidState, "Scheduler is shut down"};
        }
        spdlog::info("Concurrency limit {} -> {}", limit_, n);
        limit_ = n;
        growWorkersLocked();
    }
    cv_.notify_all();
    return {};
}

void JobScheduler::pauseQueue() {
    std::lock_guard lock(mutex_);
    paused_ = true;
    spdlog::info("Dispatch paused ({} queued)", queue_.size());
}

void JobScheduler::resumeQueue() {
    {
        std::lock_guard lock(mutex_);
        paused_ = false;
        spdlog::info("Dispatch resumed ({} queued)", queue_.size());
    }
    cv_.notify_all();
}

SchedulerStatus JobScheduler::status() const {
    std::lock_guard lock(mutex_);
    SchedulerStatus s;
    s.queued = queue_.size();
    s.running = running_.size();
    s.concurrencyLimit = limit_;
    s.workerThreads = workers_.size();
    s.paused = paused_;
    s.completed = completed_;
    s.failed = failed_;
    s.cancelled = cancelled_;
    return s;
}

bool JobScheduler::isQueued(const JobId& id) const {
    std::lock_guard lock(mutex_);
    return queued_.count(id) != 0;
}

bool JobScheduler::isRunning(const JobId& id) const {
    std::lock_guard lock(mutex_);
    return running_.count(id) != 0;
}

std::vector<JobId> JobScheduler::queuedJobs() const {
    std::lock_guard lock(mutex_);
    std::vector<JobId> out;
    out.reserve(queue_.size());
    for (const auto& e : queue_) {
        out.push_back(e.id);
    }
    return out;
}

bool JobScheduler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return doneCv_.wait_for(lock, timeout, [this] {
        return running_.empty() && (queue_.empty() || paused_ || stopping_);
    });
}

void JobScheduler::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        if (!queue_.empty()) {
            spdlog::info("Scheduler shutdown drops {} queued jobs", queue_.size());
        }
        queue_.clear();
        queued_.clear();
        for (auto& [id, token] : running_) {
            token.requestCancel();
        }
        workers.swap(workers_);
    }
    cv_.notify_all();
    doneCv_.notify_all();
    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }
}

} // namespace omnifetch::scheduler
