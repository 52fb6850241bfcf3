#include <omnifetch/health/health.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace omnifetch::health {

HealthPolicy HealthPolicy::fromConfig(const config::OrchestratorConfig& cfg) {
    HealthPolicy p;
    p.backoff.baseDelay = cfg.baseDelay;
    p.backoff.maxDelay = cfg.maxDelay;
    p.maxAttemptsPerJob = cfg.maxAttemptsPerJob;
    return p;
}

HealthController::HealthController(HealthPolicy policy,
                                   std::shared_ptr<EndpointHealthStore> health,
                                   std::shared_ptr<HealingLog> log, std::uint64_t seed)
    : policy_(policy), health_(std::move(health)), log_(std::move(log)), rng_(seed) {
    if (!health_) {
        health_ = std::make_shared<EndpointHealthStore>();
    }
    if (!log_) {
        log_ = std::make_shared<HealingLog>();
    }
}

const std::vector<std::string>& HealthController::userAgents() {
    static const std::vector<std::string> kAgents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:121.0) Gecko/20100101 Firefox/121.0",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (iPhone; CPU iPhone OS 17_2 like Mac OS X) AppleWebKit/605.1.15 (KHTML, "
        "like Gecko) Version/17.2 Mobile/15E148 Safari/604.1"};
    return kAgents;
}

std::string HealthController::nextUserAgent() {
    std::lock_guard lock(rngMutex_);
    const auto& agents = userAgents();
    return agents[nextAgent_++ % agents.size()];
}

std::chrono::milliseconds HealthController::backoffDelay(int attempt) {
    auto delay = backoffCeiling(policy_.backoff, attempt);
    const auto base = policy_.backoff.baseDelay.count();
    if (policy_.backoff.jitter && base > 0) {
        std::lock_guard lock(rngMutex_);
        std::uniform_int_distribution<std::int64_t> dist(0, base - 1);
        const auto jitter = dist(rng_);
        if (delay.count() <= std::numeric_limits<std::int64_t>::max() - jitter) {
            delay += std::chrono::milliseconds(jitter);
        }
    }
    return delay;
}

std::size_t HealthController::preferredEndpoint(const std::string& platformId,
                                                std::size_t endpointCount) const {
    return health_->preferredIndex(platformId, endpointCount);
}

void HealthController::record(const JobContext& job, ErrorClass cls, ActionKind action,
                              HealingOutcome outcome, std::string message) {
    HealingRecord r;
    r.timestamp = std::chrono::system_clock::now();
    r.jobId = job.jobId;
    r.platformId = job.platformId;
    r.endpointIndex = job.activeEndpointIndex;
    r.errorClass = cls;
    r.actionTaken = action;
    r.outcome = outcome;
    r.message = std::move(message);
    log_->append(std::move(r));
}

Action HealthController::decide(const JobContext& job, ErrorClass cls) {
    Action a;
    a.errorClass = cls;
    a.terminalClass = cls;
    a.endpointIndex = job.activeEndpointIndex;

    const bool ceilingReached = job.attemptCount >= policy_.maxAttemptsPerJob;
    auto giveUpAtCeiling = [&] {
        a.kind = ActionKind::GiveUp;
        a.reason = "attempt ceiling (" + std::to_string(policy_.maxAttemptsPerJob) + ") reached";
    };

    switch (cls) {
        case ErrorClass::Network:
        case ErrorClass::Timeout:
            health_->recordFailure(job.platformId, job.activeEndpointIndex, false);
            if (ceilingReached) {
                giveUpAtCeiling();
            } else {
                a.kind = ActionKind::Retry;
                a.delay = backoffDelay(job.retryCount);
                a.reason = "transient failure, backing off";
            }
            break;

        case ErrorClass::RateLimited:
            health_->recordFailure(job.platformId, job.activeEndpointIndex, false);
            if (ceilingReached) {
                giveUpAtCeiling();
            } else {
                a.kind = ActionKind::RateLimitWait;
                a.delay = job.retryAfter
                              ? std::chrono::duration_cast<std::chrono::milliseconds>(
                                    *job.retryAfter)
                              : backoffDelay(job.retryCount);
                a.userAgent = nextUserAgent();
                a.reason = job.retryAfter ? "honoring Retry-After" : "rate limited, backing off";
            }
            break;

        case ErrorClass::EndpointDown: {
            health_->recordFailure(job.platformId, job.activeEndpointIndex, true);
            // Round-robin over the remaining candidates, skipping any marked down this job
            std::optional<std::size_t> next;
            const std::size_t n = std::max<std::size_t>(job.endpointCount, 1);
            for (std::size_t step = 1; step < n; ++step) {
                const std::size_t idx = (job.activeEndpointIndex + step) % n;
                if (idx != job.activeEndpointIndex && job.failedEndpoints.count(idx) == 0) {
                    next = idx;
                    break;
                }
            }
            if (!next) {
                a.kind = ActionKind::GiveUp;
                a.terminalClass = ErrorClass::AllEndpointsExhausted;
                a.reason = "all " + std::to_string(n) + " endpoints exhausted";
            } else if (ceilingReached) {
                giveUpAtCeiling();
            } else {
                a.kind = ActionKind::SwitchEndpoint;
                a.endpointIndex = *next;
                a.reason = "switching to endpoint " + std::to_string(*next);
            }
            break;
        }

        case ErrorClass::ChecksumMismatch:
            if (job.checksumRestarts == 0 && !ceilingReached) {
                a.kind = ActionKind::CleanRestart;
                a.reason = "corrupt content, restarting from zero once";
            } else {
                a.kind = ActionKind::ManualReviewRequired;
                a.reason = "checksum still mismatched after a clean restart";
            }
            break;

        case ErrorClass::AuthRequired:
            a.kind = ActionKind::ManualReviewRequired;
            a.reason = "authentication required";
            break;

        case ErrorClass::PatternStale:
            a.kind = ActionKind::ManualReviewRequired;
            a.reason = "extraction pattern no longer matches; platform rules need an update";
            break;

        case ErrorClass::PlatformUnresolved:
            a.kind = ActionKind::ManualReviewRequired;
            a.reason = "no platform matches the URL";
            break;

        case ErrorClass::AllEndpointsExhausted:
            a.kind = ActionKind::GiveUp;
            a.reason = "all endpoints exhausted";
            break;
    }

    const auto outcome = a.terminal() ? HealingOutcome::Failed : HealingOutcome::RetryScheduled;
    std::string message = a.reason;
    if (!job.message.empty()) {
        message += ": " + job.message;
    }
    record(job, cls, a.kind, outcome, message);

    if (a.terminal()) {
        spdlog::warn("Job {} [{}#{}] {} -> {} ({})", job.jobId, job.platformId,
                     job.activeEndpointIndex, to_string(cls), to_string(a.kind), a.reason);
    } else {
        spdlog::info("Job {} [{}#{}] {} -> {} in {}ms ({})", job.jobId, job.platformId,
                     job.activeEndpointIndex, to_string(cls), to_string(a.kind), a.delay.count(),
                     a.reason);
    }
    return a;
}

void HealthController::recordSuccess(const JobContext& job, bool healed) {
    health_->recordSuccess(job.platformId, job.activeEndpointIndex);
    if (!healed) {
        return;
    }
    auto history = log_->recordsForJob(job.jobId);
    const auto lastClass = history.empty() ? ErrorClass::Network : history.back().errorClass;
    const auto lastAction = history.empty() ? ActionKind::Retry : history.back().actionTaken;
    record(job, lastClass, lastAction, HealingOutcome::Recovered,
           "recovered after " + std::to_string(job.attemptCount) + " attempts");
}

void HealthController::recordTerminal(const JobContext& job, ErrorClass cls) {
    const auto kind = cls == ErrorClass::AllEndpointsExhausted ? ActionKind::GiveUp
                                                               : ActionKind::ManualReviewRequired;
    record(job, cls, kind, HealingOutcome::Failed, job.message);
    spdlog::warn("Job {} failed terminally: {} ({})", job.jobId, to_string(cls), job.message);
}

} // namespace omnifetch::health
