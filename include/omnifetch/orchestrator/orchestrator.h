#pragma once

#include <omnifetch/config/config.h>
#include <omnifetch/core/types.h>
#include <omnifetch/health/health.h>
#include <omnifetch/orchestrator/event_channel.h>
#include <omnifetch/orchestrator/extractor.h>
#include <omnifetch/platform/platform.h>
#include <omnifetch/scheduler/job_scheduler.h>
#include <omnifetch/transfer/transfer.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace omnifetch::orchestrator {

enum class JobState { Queued, Resolving, Downloading, Retrying, Verifying, Completed, Failed, Cancelled };

const char* to_string(JobState state);
bool isTerminal(JobState state);

// Platform id given to jobs served by the direct-file fallback
inline constexpr const char* kDirectPlatformId = "direct";

struct SubmitOptions {
    int priority{0};
    std::optional<std::filesystem::path> destinationHint;
    std::optional<std::string> expectedChecksum;
};

/**
 * Snapshot of one job.
 */
struct JobStatus {
    JobId id;
    std::string sourceUrl;
    std::string platformId;
    std::string contentType;
    int priority{0};
    JobState state{JobState::Queued};
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    int attemptCount{0};
    std::size_t activeEndpointIndex{0};
    std::vector<std::size_t> endpointsTried; // distinct indices, in first-use order
    std::optional<Error> lastError{};
    std::optional<health::ErrorClass> lastErrorClass{};
    std::filesystem::path destination;
    std::string checksumHex; // set on completion
    bool recovered{false};
    TimePoint createdAt{};
    std::optional<TimePoint> finishedAt{};
};

enum class EventType { StateChanged, Progress, Completed, Failed, Cancelled };

const char* to_string(EventType type);

struct JobEvent {
    JobId jobId;
    EventType type{EventType::StateChanged};
    JobState state{JobState::Queued};
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<double> percent{};
    std::optional<std::uint64_t> bytesPerSecond{};
    std::string message;
    TimePoint timestamp{};

    [[nodiscard]] bool terminal() const noexcept {
        return type == EventType::Completed || type == EventType::Failed ||
               type == EventType::Cancelled;
    }
};

using EventStream = std::shared_ptr<EventChannel<JobEvent>>;

struct OrchestratorStatistics {
    std::map<JobState, std::size_t> jobsByState;
    scheduler::SchedulerStatus scheduler;
    health::HealingStatistics healing;
};

/**
 * Collaborators. Anything left null is built from the configuration.
 */
struct OrchestratorDeps {
    std::shared_ptr<platform::PlatformRegistry> registry;
    std::shared_ptr<transfer::IHttpAdapter> http;
    std::shared_ptr<transfer::IResumeStore> store;
    std::shared_ptr<transfer::IRateLimiter> limiter;
    std::shared_ptr<health::HealthController> health;
    std::shared_ptr<IContentExtractor> extractor;
};

/**
 * Owns every DownloadJob and is the only writer of job state.
 *
 * Each dispatched job runs on a scheduler worker: resolve, then transfer attempts with the
 * health controller deciding between attempts. Events are published to per-job channels (closed
 * after the terminal event) and to global channels.
 */
class Orchestrator {
public:
    explicit Orchestrator(config::OrchestratorConfig config, OrchestratorDeps deps = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Create and enqueue a job. AlreadyExists while another non-terminal job targets the same
     * destination; InvalidArgument for an empty URL.
     */
    Result<JobId> submit(const std::string& url, const SubmitOptions& options = {});

    [[nodiscard]] Result<JobStatus> status(const JobId& id) const;
    [[nodiscard]] std::vector<JobStatus> listJobs() const;

    /**
     * Events of one job. A job already in a terminal state yields a closed channel holding its
     * terminal event.
     */
    Result<EventStream> subscribe(const JobId& id);

    /**
     * Events of every job from now on. A subscriber that stops draining is cut off once
     * undelivered essential events reach four times `capacity`.
     */
    EventStream subscribeAll(std::size_t capacity = 4096);

    /**
     * Cancel a queued or running job; returns once the job is Cancelled. The partial file and
     * sidecar of a running job are kept for a later resume.
     */
    Result<void> cancel(const JobId& id);

    /**
     * Re-enqueue a Cancelled job; its transfer continues from the sidecar.
     */
    Result<void> resume(const JobId& id);

    /**
     * Re-enqueue every transfer with a sidecar in the download directory that no live job owns.
     */
    Result<std::vector<JobId>> recover();

    Result<void> setConcurrency(int n);
    void setBandwidthLimit(std::optional<std::uint64_t> bytesPerSecond);
    void pauseQueue();
    void resumeQueue();

    /**
     * Forget terminal jobs that finished more than the retention window before `now`.
     * @return number of jobs removed
     */
    std::size_t pruneFinished(TimePoint now = std::chrono::system_clock::now());

    [[nodiscard]] OrchestratorStatistics statistics() const;
    [[nodiscard]] const config::OrchestratorConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::shared_ptr<health::HealthController> healthController() const {
        return health_;
    }

    /**
     * Cancel everything and stop the workers. Queued jobs end Cancelled.
     */
    void shutdown();

private:
    struct Job {
        JobStatus status;
        std::optional<std::string> expectedChecksum;
        std::optional<std::size_t> resumeEndpointIndex; // from a recovered sidecar
        std::vector<EventStream> subscribers;
    };

    struct Endpoints {
        std::string platformId;
        std::string contentType;
        std::vector<std::string> urls;
    };

    scheduler::JobOutcome runJob(const JobId& id, const CancellationToken& token);
    scheduler::JobOutcome executeJob(const JobId& id, const CancellationToken& token);
    Result<Endpoints> resolveEndpoints(const JobId& id);

    void setState(const JobId& id, JobState state, const std::string& message = {});
    void setStateLocked(Job& job, JobState state, const std::string& message);
    void publishLocked(Job& job, JobEvent event, bool essential);
    [[nodiscard]] static JobEvent makeEvent(const Job& job, EventType type, std::string message);
    std::size_t pruneLocked(TimePoint now);
    scheduler::JobOutcome finishCancelled(const JobId& id, const std::string& message);
    scheduler::JobOutcome finishFailed(const JobId& id, health::ErrorClass cls,
                                       const std::string& message);
    scheduler::JobOutcome finishUnexpected(const JobId& id, const std::string& message);
    Result<std::filesystem::path> chooseDestinationLocked(const std::string& url,
                                                          const SubmitOptions& options) const;
    [[nodiscard]] bool destinationBusyLocked(const std::filesystem::path& dest,
                                             const JobId& except = {}) const;

    config::OrchestratorConfig config_;
    std::shared_ptr<platform::PlatformRegistry> registry_;
    std::shared_ptr<transfer::IResumeStore> store_;
    std::shared_ptr<transfer::IRateLimiter> limiter_;
    std::shared_ptr<health::HealthController> health_;
    std::shared_ptr<IContentExtractor> extractor_;
    std::unique_ptr<transfer::TransferEngine> engine_;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    std::vector<EventStream> globalSubscribers_;
    bool shutdown_{false};

    // Declared last: destroyed first so no worker outlives the state above
    std::unique_ptr<scheduler::JobScheduler> scheduler_;
};

} // namespace omnifetch::orchestrator
