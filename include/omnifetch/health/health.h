#pragma once

#include <omnifetch/config/config.h>
#include <omnifetch/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace omnifetch::health {

enum class ErrorClass {
    Network,
    Timeout,
    RateLimited,
    EndpointDown,
    AuthRequired,
    ChecksumMismatch,
    PatternStale,
    PlatformUnresolved,
    AllEndpointsExhausted
};

const char* to_string(ErrorClass cls);
std::optional<ErrorClass> parse_error_class(std::string_view name);

/**
 * Core error code carried by a job that failed with `cls`.
 */
ErrorCode toErrorCode(ErrorClass cls);

enum class ActionKind {
    Retry,                // same endpoint after backoff
    RateLimitWait,        // same endpoint after cool-down, rotated headers
    SwitchEndpoint,       // next candidate endpoint, immediately
    CleanRestart,         // partial discarded, same endpoint, immediately
    ManualReviewRequired, // terminal: needs a human (auth, stale pattern, corrupt content)
    GiveUp                // terminal: attempt ceiling or endpoints exhausted
};

const char* to_string(ActionKind kind);
std::optional<ActionKind> parse_action_kind(std::string_view name);

enum class HealingOutcome { RetryScheduled, Recovered, Failed };

const char* to_string(HealingOutcome outcome);
std::optional<HealingOutcome> parse_healing_outcome(std::string_view name);

/**
 * What the transfer layer reported for a failed attempt.
 */
struct FailureInfo {
    Error error;
    std::optional<int> httpStatus{};
    std::optional<std::chrono::seconds> retryAfter{};
};

ErrorClass classify(const FailureInfo& failure);

// ===================
// Backoff
// ===================

struct BackoffPolicy {
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    bool jitter{true};
};

/**
 * min(maxDelay, baseDelay * 2^attempt), without jitter. Non-decreasing in `attempt`.
 */
std::chrono::milliseconds backoffCeiling(const BackoffPolicy& policy, int attempt);

// ===================
// Endpoint health
// ===================

struct EndpointHealth {
    int consecutiveFailures{0};
    std::optional<TimePoint> lastCheckedAt{};
    bool lastKnownGood{true};
};

/**
 * Advisory health per (platformId, endpointIndex). Written by the health controller on every
 * attempt outcome, read at dispatch time; an unhealthy mark expires after `cooldown`.
 */
class EndpointHealthStore {
public:
    explicit EndpointHealthStore(std::chrono::milliseconds cooldown = std::chrono::minutes(5));

    void recordSuccess(const std::string& platformId, std::size_t index,
                       TimePoint now = std::chrono::system_clock::now());
    void recordFailure(const std::string& platformId, std::size_t index, bool markUnhealthy,
                       TimePoint now = std::chrono::system_clock::now());

    [[nodiscard]] EndpointHealth get(const std::string& platformId, std::size_t index) const;
    [[nodiscard]] bool isHealthy(const std::string& platformId, std::size_t index,
                                 TimePoint now = std::chrono::system_clock::now()) const;

    /**
     * First healthy index in [0, endpointCount); 0 when every endpoint is marked unhealthy.
     */
    [[nodiscard]] std::size_t
    preferredIndex(const std::string& platformId, std::size_t endpointCount,
                   TimePoint now = std::chrono::system_clock::now()) const;

    [[nodiscard]] std::map<std::pair<std::string, std::size_t>, EndpointHealth> snapshot() const;

private:
    std::chrono::milliseconds cooldown_;
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, std::size_t>, EndpointHealth> entries_;
};

// ===================
// Healing log
// ===================

struct HealingRecord {
    TimePoint timestamp{};
    JobId jobId;
    std::string platformId;
    std::size_t endpointIndex{0};
    ErrorClass errorClass{ErrorClass::Network};
    ActionKind actionTaken{ActionKind::Retry};
    HealingOutcome outcome{HealingOutcome::RetryScheduled};
    std::string message;
};

struct HealingStatistics {
    std::size_t totalRecords{0};
    std::size_t recovered{0};
    std::size_t failed{0};
    double successRate{0.0}; // recovered / (recovered + failed); 0 when neither happened
    std::map<ErrorClass, std::size_t> byErrorClass;
    std::map<std::string, std::size_t> byPlatform;
};

/**
 * Append-only record of healing decisions, optionally mirrored to a JSON-lines file.
 */
class HealingLog {
public:
    explicit HealingLog(std::optional<std::filesystem::path> persistPath = std::nullopt);

    /**
     * Reload records from the persistence file; malformed lines are skipped.
     * NotFound when no persistence path is configured.
     */
    Result<std::size_t> load();

    void append(HealingRecord record);

    [[nodiscard]] std::vector<HealingRecord> records() const;
    [[nodiscard]] std::vector<HealingRecord> recordsForJob(const JobId& jobId) const;
    [[nodiscard]] HealingStatistics statistics() const;
    [[nodiscard]] std::size_t size() const;

private:
    std::optional<std::filesystem::path> persistPath_;
    mutable std::mutex mutex_;
    std::vector<HealingRecord> records_;
};

// ===================
// Controller
// ===================

/**
 * The job facts decide() needs; the orchestrator owns the job and builds this view.
 */
struct JobContext {
    JobId jobId;
    std::string platformId;
    std::size_t activeEndpointIndex{0};
    std::size_t endpointCount{1};
    int attemptCount{0}; // attempts made, including the one that just failed
    int retryCount{0};   // backoff exponent: waits already taken by this job
    std::set<std::size_t> failedEndpoints; // marked down during this job
    int checksumRestarts{0};
    std::optional<std::chrono::seconds> retryAfter{};
    std::string message; // error text of the failed attempt
};

struct Action {
    ActionKind kind{ActionKind::GiveUp};
    ErrorClass errorClass{ErrorClass::Network};
    ErrorClass terminalClass{ErrorClass::Network}; // class the job fails with when terminal
    std::chrono::milliseconds delay{0};
    std::size_t endpointIndex{0};         // endpoint for the next attempt
    std::optional<std::string> userAgent; // header rotation on rate limits
    std::string reason;

    [[nodiscard]] bool terminal() const noexcept {
        return kind == ActionKind::GiveUp || kind == ActionKind::ManualReviewRequired;
    }
};

struct HealthPolicy {
    BackoffPolicy backoff{};
    int maxAttemptsPerJob{6};

    static HealthPolicy fromConfig(const config::OrchestratorConfig& cfg);
};

/**
 * Classifies failures and decides remediation. Thread-safe; called synchronously from the
 * worker executing the failed job.
 */
class HealthController {
public:
    HealthController(HealthPolicy policy, std::shared_ptr<EndpointHealthStore> health,
                     std::shared_ptr<HealingLog> log, std::uint64_t seed = std::random_device{}());

    [[nodiscard]] ErrorClass classify(const FailureInfo& failure) const {
        return health::classify(failure);
    }

    /**
     * Pick the next step for `job` after a failure of class `cls`. Updates endpoint health and
     * appends one HealingRecord.
     */
    Action decide(const JobContext& job, ErrorClass cls);

    /**
     * Backoff for the `attempt`-th wait, jitter included when enabled.
     */
    std::chrono::milliseconds backoffDelay(int attempt);

    /**
     * A successful attempt: endpoint marked good; a Recovered record when the job healed.
     */
    void recordSuccess(const JobContext& job, bool healed);

    /**
     * Terminal failure decided outside decide() (e.g. PlatformUnresolved at resolve time).
     */
    void recordTerminal(const JobContext& job, ErrorClass cls);

    /**
     * Start index for a fresh dispatch: first endpoint not currently marked unhealthy.
     */
    [[nodiscard]] std::size_t preferredEndpoint(const std::string& platformId,
                                                std::size_t endpointCount) const;

    [[nodiscard]] const HealthPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] std::shared_ptr<EndpointHealthStore> endpointHealth() const { return health_; }
    [[nodiscard]] std::shared_ptr<HealingLog> healingLog() const { return log_; }

    /**
     * User-Agent pool used for header rotation.
     */
    static const std::vector<std::string>& userAgents();

private:
    std::string nextUserAgent();
    void record(const JobContext& job, ErrorClass cls, ActionKind action, HealingOutcome outcome,
                std::string message);

    HealthPolicy policy_;
    std::shared_ptr<EndpointHealthStore> health_;
    std::shared_ptr<HealingLog> log_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;
    std::size_t nextAgent_{0};
};

} // namespace omnifetch::health
