#include <omnifetch/core/ids.h>
#include <omnifetch/orchestrator/orchestrator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>

namespace omnifetch::orchestrator {

namespace {

std::string joinIndices(const std::vector<std::size_t>& indices) {
    std::string out;
    for (auto i : indices) {
        if (!out.empty())
            out += ",";
        out += std::to_string(i);
    }
    return out;
}

EventType terminalEventType(JobState state) {
    switch (state) {
        case JobState::Completed:
            return EventType::Completed;
        case JobState::Failed:
            return EventType::Failed;
        case JobState::Cancelled:
            return EventType::Cancelled;
        default:
            return EventType::StateChanged;
    }
}

} // namespace

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Queued:
            return "queued";
        case JobState::Resolving:
            return "resolving";
        case JobState::Downloading:
            return "downloading";
        case JobState::Retrying:
            return "retrying";
        case JobState::Verifying:
            return "verifying";
        case JobState::Completed:
            return "completed";
        case JobState::Failed:
            return "failed";
        case JobState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

bool isTerminal(JobState state) {
    return state == JobState::Completed || state == JobState::Failed ||
           state == JobState::Cancelled;
}

const char* to_string(EventType type) {
    switch (type) {
        case EventType::StateChanged:
            return "state";
        case EventType::Progress:
            return "progress";
        case EventType::Completed:
            return "completed";
        case EventType::Failed:
            return "failed";
        case EventType::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

Orchestrator::Orchestrator(config::OrchestratorConfig config, OrchestratorDeps deps)
    : config_(std::move(config)) {
    config::apply_log_level(config_.logLevel);
    registry_ = deps.registry ? std::move(deps.registry) : platform::makeBuiltinRegistry();

    std::shared_ptr<transfer::IHttpAdapter> http = std::move(deps.http);
    if (!http)
        http = transfer::makeCurlHttpAdapter();
    store_ = deps.store ? std::move(deps.store)
                        : std::shared_ptr<transfer::IResumeStore>(transfer::makeSidecarStore());
    limiter_ = deps.limiter ? std::move(deps.limiter)
                            : std::shared_ptr<transfer::IRateLimiter>(transfer::makeTokenBucketLimiter(
                                  config_.bandwidthLimitBytesPerSec.value_or(0)));

    health_ = std::move(deps.health);
    if (!health_) {
        auto log = std::make_shared<health::HealingLog>(config_.healingLogPath);
        if (config_.healingLogPath) {
            auto loaded = log->load();
            if (loaded) {
                spdlog::info("Loaded {} healing records from {}", loaded.value(),
                             config_.healingLogPath->string());
            } else {
                spdlog::warn("Healing log not loaded: {}", loaded.error().message);
            }
        }
        health_ = std::make_shared<health::HealthController>(
            health::HealthPolicy::fromConfig(config_),
            std::make_shared<health::EndpointHealthStore>(config_.healthCooldown), std::move(log));
    }

    extractor_ = deps.extractor ? std::move(deps.extractor) : std::make_shared<DirectExtractor>();
    engine_ = std::make_unique<transfer::TransferEngine>(
        std::move(http), store_, limiter_, transfer::TransferOptions::fromConfig(config_));

    std::error_code ec;
    std::filesystem::create_directories(config_.downloadDir, ec);
    if (ec) {
        spdlog::warn("Cannot create download directory {}: {}", config_.downloadDir.string(),
                     ec.message());
    }

    scheduler_ = std::make_unique<scheduler::JobScheduler>(
        config_.maxConcurrency,
        [this](const JobId& id, const CancellationToken& token) { return runJob(id, token); });

    spdlog::info("Orchestrator ready: {} platforms, concurrency {}, downloads in {}",
                 registry_->size(), config_.maxConcurrency, config_.downloadDir.string());
}

Orchestrator::~Orchestrator() {
    shutdown();
}

// ===================
// Submission and queries
// ===================

Result<JobId> Orchestrator::submit(const std::string& url, const SubmitOptions& options) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    std::lock_guard lock(mutex_);
    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Orchestrator is shut down"};
    }
    pruneLocked(std::chrono::system_clock::now());
    auto chosen = chooseDestinationLocked(url, options);
    if (!chosen) {
        return chosen.error();
    }
    const auto dest = std::move(chosen).value();

    JobId id = core::generateId("job");
    while (jobs_.count(id) != 0) {
        id = core::generateId("job");
    }

    Job job;
    job.status.id = id;
    job.status.sourceUrl = url;
    job.status.priority = options.priority;
    job.status.destination = dest;
    job.status.createdAt = std::chrono::system_clock::now();
    if (options.expectedChecksum) {
        job.expectedChecksum = transfer::normalizeChecksum(*options.expectedChecksum);
    }
    auto [it, inserted] = jobs_.emplace(id, std::move(job));

    if (auto r = scheduler_->submit(id, options.priority); !r) {
        jobs_.erase(it);
        return r.error();
    }
    publishLocked(it->second, makeEvent(it->second, EventType::StateChanged, "queued"), true);
    spdlog::info("Submitted job {} (priority {}): {} -> {}", id, options.priority, url,
                 dest.string());
    return id;
}

Result<JobStatus> Orchestrator::status(const JobId& id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    }
    return it->second.status;
}

std::vector<JobStatus> Orchestrator::listJobs() const {
    std::lock_guard lock(mutex_);
    std::vector<JobStatus> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        out.push_back(job.status);
    }
    std::sort(out.begin(), out.end(), [](const JobStatus& a, const JobStatus& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
    });
    return out;
}

Result<EventStream> Orchestrator::subscribe(const JobId& id) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    }
    auto& job = it->second;
    auto channel = std::make_shared<EventChannel<JobEvent>>();
    if (isTerminal(job.status.state)) {
        channel->push(makeEvent(job, terminalEventType(job.status.state),
                                job.status.lastError ? job.status.lastError->message : ""),
                      true);
        channel->close();
        return channel;
    }
    channel->push(makeEvent(job, EventType::StateChanged, "subscribed"), true);
    job.subscribers.push_back(channel);
    return channel;
}

EventStream Orchestrator::subscribeAll(std::size_t capacity) {
    std::lock_guard lock(mutex_);
    auto channel = std::make_shared<EventChannel<JobEvent>>(capacity);
    if (shutdown_) {
        channel->close();
    } else {
        globalSubscribers_.push_back(channel);
    }
    return channel;
}

// ===================
// Control
// ===================

Result<void> Orchestrator::cancel(const JobId& id) {
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return Error{ErrorCode::NotFound, "Unknown job: " + id};
        }
        if (isTerminal(it->second.status.state)) {
            return Error{ErrorCode::InvalidState,
                         "Job " + id + " already " + to_string(it->second.status.state)};
        }
    }

    // Blocks until a running executor has returned; must not hold mutex_ here
    const auto result = scheduler_->cancel(id);

    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    }
    auto& job = it->second;
    if (!isTerminal(job.status.state)) {
        setStateLocked(job, JobState::Cancelled,
                       result == scheduler::CancelResult::RemovedFromQueue
                           ? "cancelled while queued"
                           : "cancelled");
    }
    if (job.status.state != JobState::Cancelled) {
        return Error{ErrorCode::InvalidState, "Job " + id + " finished as " +
                                                  to_string(job.status.state) +
                                                  " before the cancellation took effect"};
    }
    return {};
}

Result<void> Orchestrator::resume(const JobId& id) {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Orchestrator is shut down"};
    }
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    }
    auto& job = it->second;
    if (job.status.state != JobState::Cancelled) {
        return Error{ErrorCode::InvalidState, "Only cancelled jobs can be resumed; " + id +
                                                  " is " + to_string(job.status.state)};
    }
    if (destinationBusyLocked(job.status.destination, id)) {
        return Error{ErrorCode::AlreadyExists,
                     "Another active job already writes " + job.status.destination.string()};
    }

    job.status.attemptCount = 0;
    job.status.endpointsTried.clear();
    job.status.lastError.reset();
    job.status.lastErrorClass.reset();
    job.status.finishedAt.reset();
    if (auto r = scheduler_->submit(id, job.status.priority); !r) {
        return r.error();
    }
    setStateLocked(job, JobState::Queued, "resumed");
    spdlog::info("Job {} resumed from {} bytes", id, job.status.downloadedBytes);
    return {};
}

Result<std::vector<JobId>> Orchestrator::recover() {
    std::vector<JobId> recovered;
    for (const auto& dest : transfer::findSidecarDestinations(config_.downloadDir)) {
        auto loaded = store_->load(dest);
        if (!loaded) {
            spdlog::warn("Skipping unreadable sidecar for {}: {}", dest.string(),
                         loaded.error().message);
            continue;
        }
        if (!loaded.value() || loaded.value()->url.empty()) {
            continue;
        }
        const auto& state = *loaded.value();

        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Orchestrator is shut down"};
        }
        if (destinationBusyLocked(dest)) {
            spdlog::debug("Sidecar for {} belongs to a live job", dest.string());
            continue;
        }

        JobId id = state.job.id;
        while (id.empty() || jobs_.count(id) != 0) {
            id = core::generateId("job");
        }

        Job job;
        job.status.id = id;
        job.status.sourceUrl = state.url;
        job.status.platformId = state.job.platformId;
        job.status.contentType = state.job.contentType;
        job.status.priority = state.job.priority;
        job.status.destination = dest;
        job.status.downloadedBytes = state.downloadedBytes;
        job.status.totalBytes = state.totalBytes;
        job.status.recovered = true;
        job.status.createdAt = std::chrono::system_clock::now();
        job.resumeEndpointIndex = state.endpointIndex;
        auto [it, inserted] = jobs_.emplace(id, std::move(job));

        if (auto r = scheduler_->submit(id, state.job.priority); !r) {
            spdlog::warn("Cannot re-enqueue {}: {}", dest.string(), r.error().message);
            jobs_.erase(it);
            continue;
        }
        publishLocked(it->second, makeEvent(it->second, EventType::StateChanged, "recovered"),
                      true);
        spdlog::info("Recovered job {} for {} at {} bytes", id, dest.string(),
                     state.downloadedBytes);
        recovered.push_back(id);
    }
    if (!recovered.empty()) {
        spdlog::info("Re-enqueued {} interrupted transfers from {}", recovered.size(),
                     config_.downloadDir.string());
    }
    return recovered;
}

Result<void> Orchestrator::setConcurrency(int n) {
    return scheduler_->setConcurrency(n);
}

void Orchestrator::setBandwidthLimit(std::optional<std::uint64_t> bytesPerSecond) {
    limiter_->setRate(bytesPerSecond.value_or(0));
    spdlog::info("Bandwidth limit {}", bytesPerSecond ? std::to_string(*bytesPerSecond) + " B/s"
                                                      : std::string("off"));
}

void Orchestrator::pauseQueue() {
    scheduler_->pauseQueue();
}

void Orchestrator::resumeQueue() {
    scheduler_->resumeQueue();
}

std::size_t Orchestrator::pruneFinished(TimePoint now) {
    std::lock_guard lock(mutex_);
    return pruneLocked(now);
}

std::size_t Orchestrator::pruneLocked(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        const auto& s = it->second.status;
        if (isTerminal(s.state) && s.finishedAt && now - *s.finishedAt >= config_.jobRetention) {
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Pruned {} finished jobs", removed);
    }
    return removed;
}

OrchestratorStatistics Orchestrator::statistics() const {
    OrchestratorStatistics stats;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            ++stats.jobsByState[job.status.state];
        }
    }
    stats.scheduler = scheduler_->status();
    stats.healing = health_->healingLog()->statistics();
    return stats;
}

void Orchestrator::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }
    spdlog::info("Orchestrator shutting down");
    scheduler_->shutdown();

    std::lock_guard lock(mutex_);
    for (auto& [id, job] : jobs_) {
        if (!isTerminal(job.status.state)) {
            setStateLocked(job, JobState::Cancelled, "shut down before dispatch");
        }
    }
    for (auto& channel : globalSubscribers_) {
        channel->close();
    }
    globalSubscribers_.clear();
}

// ===================
// Job execution (scheduler worker thread)
// ===================

Result<Orchestrator::Endpoints> Orchestrator::resolveEndpoints(const JobId& id) {
    std::string url;
    std::string platformId;
    std::string contentType;
    bool recovered = false;
    {
        std::lock_guard lock(mutex_);
        auto& job = jobs_.at(id);
        url = job.status.sourceUrl;
        platformId = job.status.platformId;
        contentType = job.status.contentType;
        recovered = job.status.recovered;
        if (!recovered) {
            setStateLocked(job, JobState::Resolving, {});
        }
    }

    if (recovered && !platformId.empty()) {
        if (platformId == kDirectPlatformId) {
            return Endpoints{platformId, contentType, {url}};
        }
        if (auto urls = registry_->candidateEndpoints(platformId, url); urls) {
            return Endpoints{platformId, contentType, std::move(urls).value()};
        }
        spdlog::warn("Recovered job {} names unknown platform '{}'; resolving again", id,
                     platformId);
    }

    auto resolution = registry_->resolve(url);
    if (!resolution) {
        if (resolution.error().code == ErrorCode::NotFound && config_.allowDirectFallback) {
            spdlog::info("Job {}: no platform matches {}, fetching it directly", id, url);
            return Endpoints{kDirectPlatformId, platform::detectContentType(url), {url}};
        }
        return Error{ErrorCode::PlatformUnresolved, "No platform matches " + url};
    }

    const auto& r = resolution.value();
    auto urls = registry_->candidateEndpoints(r.platformId, url);
    if (!urls) {
        return Error{ErrorCode::PlatformUnresolved, urls.error().message};
    }
    if (urls.value().empty()) {
        return Error{ErrorCode::PlatformUnresolved, "Platform " + r.platformId + " has no endpoints"};
    }
    spdlog::info("Job {} resolved to {} ({}), {} candidate endpoints", id, r.platformId,
                 r.contentType, urls.value().size());
    return Endpoints{r.platformId, r.contentType, std::move(urls).value()};
}

scheduler::JobOutcome Orchestrator::runJob(const JobId& id, const CancellationToken& token) {
    // Every dispatched job must end terminal, or its destination stays locked
    try {
        return executeJob(id, token);
    } catch (const std::exception& e) {
        return finishUnexpected(id, e.what());
    }
}

scheduler::JobOutcome Orchestrator::executeJob(const JobId& id, const CancellationToken& token) {
    using health::ActionKind;
    using health::ErrorClass;

    if (token.isCancelled()) {
        return finishCancelled(id, "cancelled before start");
    }

    auto resolved = resolveEndpoints(id);
    if (!resolved) {
        health::JobContext ctx;
        ctx.jobId = id;
        ctx.message = resolved.error().message;
        health_->recordTerminal(ctx, ErrorClass::PlatformUnresolved);
        return finishFailed(id, ErrorClass::PlatformUnresolved, resolved.error().message);
    }
    const auto& endpoints = resolved.value();

    transfer::TransferRequest base;
    std::optional<std::size_t> resumeIndex;
    {
        std::lock_guard lock(mutex_);
        auto& job = jobs_.at(id);
        job.status.platformId = endpoints.platformId;
        job.status.contentType = endpoints.contentType;
        base.sourceUrl = job.status.sourceUrl;
        base.destination = job.status.destination;
        base.expectedChecksum = job.expectedChecksum;
        base.job = transfer::JobMeta{id, endpoints.platformId, endpoints.contentType,
                                     job.status.priority};
        resumeIndex = job.resumeEndpointIndex;
    }

    // Continue on the endpoint an existing partial came from so its bytes stay usable
    if (!resumeIndex) {
        auto sidecar = store_->load(base.destination);
        if (sidecar && sidecar.value() && sidecar.value()->url == base.sourceUrl) {
            resumeIndex = sidecar.value()->endpointIndex;
        }
    }

    health::JobContext ctx;
    ctx.jobId = id;
    ctx.platformId = endpoints.platformId;
    ctx.endpointCount = endpoints.urls.size();
    ctx.activeEndpointIndex = resumeIndex && *resumeIndex < endpoints.urls.size()
                                  ? *resumeIndex
                                  : health_->preferredEndpoint(ctx.platformId, ctx.endpointCount);
    std::optional<std::string> rotatedAgent;

    while (true) {
        if (token.isCancelled()) {
            return finishCancelled(id, "cancelled");
        }
        ++ctx.attemptCount;
        const std::size_t index = ctx.activeEndpointIndex;
        {
            std::lock_guard lock(mutex_);
            auto& job = jobs_.at(id);
            job.status.attemptCount = ctx.attemptCount;
            job.status.activeEndpointIndex = index;
            auto& tried = job.status.endpointsTried;
            if (std::find(tried.begin(), tried.end(), index) == tried.end()) {
                tried.push_back(index);
            }
            setStateLocked(job, JobState::Downloading,
                           "attempt " + std::to_string(ctx.attemptCount) + " on endpoint " +
                               std::to_string(index));
        }

        health::FailureInfo failure;
        ExtractionRequest extraction{id,
                                     base.sourceUrl,
                                     endpoints.platformId,
                                     endpoints.contentType,
                                     endpoints.urls[index],
                                     index};
        auto located = extractor_->locate(extraction, token);
        if (!located) {
            failure.error = normalizeExtractionError(located.error());
        } else {
            auto request = base;
            request.endpointUrl = located.value().url;
            request.endpointIndex = index;
            request.attempt = ctx.attemptCount;
            request.headers = located.value().headers;
            if (rotatedAgent) {
                transfer::setHeader(request.headers, "User-Agent", *rotatedAgent);
            }
            if (!request.expectedChecksum && located.value().expectedChecksum) {
                request.expectedChecksum =
                    transfer::normalizeChecksum(*located.value().expectedChecksum);
            }

            auto lastEmit = std::chrono::steady_clock::now();
            std::uint64_t lastBytes = 0;
            bool sampled = false;
            auto onProgress = [&](const transfer::TransferProgress& p) {
                std::lock_guard lock(mutex_);
                auto& job = jobs_.at(id);
                job.status.downloadedBytes = p.downloadedBytes;
                if (p.totalBytes) {
                    job.status.totalBytes = p.totalBytes;
                }
                if (p.stage == transfer::TransferStage::Verifying ||
                    p.stage == transfer::TransferStage::Finalizing) {
                    setStateLocked(job, JobState::Verifying, {});
                    return;
                }
                if (p.stage != transfer::TransferStage::Downloading) {
                    return;
                }
                const auto now = std::chrono::steady_clock::now();
                const bool done = p.totalBytes && p.downloadedBytes >= *p.totalBytes;
                if (sampled && now - lastEmit < config_.progressInterval && !done) {
                    return;
                }
                auto event = makeEvent(job, EventType::Progress, {});
                const auto elapsedMs =
                    std::chrono::duration_cast<std::chrono::milliseconds>(now - lastEmit).count();
                if (sampled && elapsedMs > 0 && p.downloadedBytes >= lastBytes) {
                    event.bytesPerSecond = (p.downloadedBytes - lastBytes) * 1000 /
                                           static_cast<std::uint64_t>(elapsedMs);
                }
                sampled = true;
                lastEmit = now;
                lastBytes = p.downloadedBytes;
                publishLocked(job, std::move(event), false);
            };

            auto result = engine_->transfer(request, token, onProgress);
            switch (result.status) {
                case transfer::TransferStatus::Completed: {
                    health_->recordSuccess(ctx, ctx.attemptCount > 1);
                    std::lock_guard lock(mutex_);
                    auto& job = jobs_.at(id);
                    job.status.downloadedBytes = result.downloadedBytes;
                    job.status.totalBytes = result.totalBytes;
                    job.status.checksumHex = result.checksumHex;
                    job.status.lastError.reset();
                    job.status.lastErrorClass.reset();
                    job.resumeEndpointIndex.reset();
                    setStateLocked(job, JobState::Completed,
                                   "saved " + result.finalPath.string());
                    spdlog::info("Job {} completed: {} ({} bytes, {} {}, {} attempts)", id,
                                 result.finalPath.string(), result.downloadedBytes,
                                 config::to_string(engine_->options().algorithm),
                                 result.checksumHex, ctx.attemptCount);
                    return scheduler::JobOutcome::Completed;
                }
                case transfer::TransferStatus::Cancelled:
                    return finishCancelled(id, "cancelled at " +
                                                   std::to_string(result.downloadedBytes) +
                                                   " bytes");
                case transfer::TransferStatus::Failed:
                    failure.error = result.error.value_or(Error{ErrorCode::Unknown});
                    failure.httpStatus = result.httpStatus;
                    failure.retryAfter = result.retryAfter;
                    break;
            }
        }

        // Cancellation racing a failure is still a cancellation
        if (token.isCancelled() || failure.error.code == ErrorCode::OperationCancelled) {
            return finishCancelled(id, "cancelled");
        }

        const auto cls = health_->classify(failure);
        ctx.retryAfter = failure.retryAfter;
        ctx.message = failure.error.message;
        const auto action = health_->decide(ctx, cls);
        {
            std::lock_guard lock(mutex_);
            auto& job = jobs_.at(id);
            job.status.lastError = failure.error;
            job.status.lastErrorClass = cls;
        }
        if (action.terminal()) {
            return finishFailed(id, action.terminalClass,
                                action.reason + ": " + failure.error.message);
        }

        switch (action.kind) {
            case ActionKind::Retry:
                ++ctx.retryCount;
                break;
            case ActionKind::RateLimitWait:
                ++ctx.retryCount;
                rotatedAgent = action.userAgent;
                break;
            case ActionKind::SwitchEndpoint:
                ctx.failedEndpoints.insert(index);
                ctx.activeEndpointIndex = action.endpointIndex;
                break;
            case ActionKind::CleanRestart: {
                ++ctx.checksumRestarts;
                store_->remove(base.destination);
                std::error_code ec;
                std::filesystem::remove(transfer::partialPathFor(base.destination), ec);
                break;
            }
            default:
                break;
        }

        setState(id, JobState::Retrying,
                 action.reason + (action.delay.count() > 0
                                      ? " (waiting " + std::to_string(action.delay.count()) + "ms)"
                                      : std::string{}));
        if (action.delay.count() > 0 && token.waitFor(action.delay)) {
            return finishCancelled(id, "cancelled while waiting to retry");
        }
    }
}

scheduler::JobOutcome Orchestrator::finishCancelled(const JobId& id, const std::string& message) {
    std::lock_guard lock(mutex_);
    auto& job = jobs_.at(id);
    setStateLocked(job, JobState::Cancelled, message);
    spdlog::info("Job {} {}; partial kept at {} bytes", id, message, job.status.downloadedBytes);
    return scheduler::JobOutcome::Cancelled;
}

scheduler::JobOutcome Orchestrator::finishFailed(const JobId& id, health::ErrorClass cls,
                                                 const std::string& message) {
    std::lock_guard lock(mutex_);
    auto& job = jobs_.at(id);
    const std::string full = std::string(health::to_string(cls)) + ": " + message + " (" +
                             std::to_string(job.status.attemptCount) + " attempts, endpoints [" +
                             joinIndices(job.status.endpointsTried) + "])";
    job.status.lastErrorClass = cls;
    job.status.lastError = Error{health::toErrorCode(cls), full};
    setStateLocked(job, JobState::Failed, full);
    spdlog::error("Job {} failed: {}", id, full);
    return scheduler::JobOutcome::Failed;
}

scheduler::JobOutcome Orchestrator::finishUnexpected(const JobId& id,
                                                     const std::string& message) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        spdlog::error("Job {} threw after it was pruned: {}", id, message);
        return scheduler::JobOutcome::Failed;
    }
    auto& job = it->second;
    if (job.status.state == JobState::Completed) {
        return scheduler::JobOutcome::Completed;
    }
    if (job.status.state == JobState::Cancelled) {
        return scheduler::JobOutcome::Cancelled;
    }
    if (job.status.state != JobState::Failed) {
        job.status.lastError = Error{ErrorCode::Unknown, "Unexpected error: " + message};
        setStateLocked(job, JobState::Failed, job.status.lastError->message);
    }
    spdlog::error("Job {} failed unexpectedly: {}", id, message);
    return scheduler::JobOutcome::Failed;
}

// ===================
// State and events
// ===================

void Orchestrator::setState(const JobId& id, JobState state, const std::string& message) {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end()) {
        setStateLocked(it->second, state, message);
    }
}

void Orchestrator::setStateLocked(Job& job, JobState state, const std::string& message) {
    if (job.status.state == state) {
        return;
    }
    spdlog::debug("Job {}: {} -> {}{}{}", job.status.id, to_string(job.status.state),
                  to_string(state), message.empty() ? "" : " ", message);
    job.status.state = state;
    if (isTerminal(state)) {
        job.status.finishedAt = std::chrono::system_clock::now();
    }
    publishLocked(job, makeEvent(job, terminalEventType(state), message), true);
}

JobEvent Orchestrator::makeEvent(const Job& job, EventType type, std::string message) {
    JobEvent e;
    e.jobId = job.status.id;
    e.type = type;
    e.state = job.status.state;
    e.downloadedBytes = job.status.downloadedBytes;
    e.totalBytes = job.status.totalBytes;
    if (job.status.totalBytes && *job.status.totalBytes > 0) {
        e.percent = 100.0 * static_cast<double>(job.status.downloadedBytes) /
                    static_cast<double>(*job.status.totalBytes);
    }
    e.message = std::move(message);
    e.timestamp = std::chrono::system_clock::now();
    return e;
}

void Orchestrator::publishLocked(Job& job, JobEvent event, bool essential) {
    for (auto& channel : job.subscribers) {
        channel->push(event, essential);
    }
    // Global subscribers that dropped their handle are no longer fed
    globalSubscribers_.erase(std::remove_if(globalSubscribers_.begin(), globalSubscribers_.end(),
                                            [](const EventStream& c) { return c.use_count() == 1; }),
                             globalSubscribers_.end());
    for (auto it = globalSubscribers_.begin(); it != globalSubscribers_.end();) {
        if (!(*it)->push(event, essential) && (*it)->overflowed()) {
            spdlog::warn("Dropping a global subscriber that stopped draining ({} events queued)",
                         (*it)->size());
            it = globalSubscribers_.erase(it);
        } else {
            ++it;
        }
    }
    if (event.terminal()) {
        for (auto& channel : job.subscribers) {
            channel->close();
        }
        job.subscribers.clear();
    }
}

Result<std::filesystem::path>
Orchestrator::chooseDestinationLocked(const std::string& url, const SubmitOptions& options) const {
    const auto base = transfer::resolveDestination(config_.downloadDir, options.destinationHint, url);
    if (options.destinationHint && !options.destinationHint->empty()) {
        // An explicit path is taken as given
        if (destinationBusyLocked(base)) {
            return Error{ErrorCode::AlreadyExists,
                         "Another active job already writes " + base.string()};
        }
        return base;
    }

    // Derived names never overwrite another URL's file; a partial of the same URL is reused
    constexpr int kMaxSuffix = 1000;
    for (int n = 0; n < kMaxSuffix; ++n) {
        const auto candidate = transfer::withCollisionSuffix(base, n);
        if (destinationBusyLocked(candidate)) {
            const auto wanted = candidate.lexically_normal();
            const bool sameUrl = std::any_of(jobs_.begin(), jobs_.end(), [&](const auto& entry) {
                const auto& s = entry.second.status;
                return !isTerminal(s.state) && s.sourceUrl == url &&
                       s.destination.lexically_normal() == wanted;
            });
            if (sameUrl) {
                return Error{ErrorCode::AlreadyExists,
                             "Another active job already writes " + candidate.string()};
            }
            continue;
        }
        std::error_code ec;
        if (std::filesystem::exists(transfer::sidecarPathFor(candidate), ec)) {
            auto sidecar = store_->load(candidate);
            if (!sidecar || !sidecar.value() || sidecar.value()->url == url) {
                return candidate;
            }
            continue;
        }
        if (std::filesystem::exists(candidate, ec)) {
            continue;
        }
        return candidate;
    }
    return Error{ErrorCode::ResourceExhausted, "No free file name for " + base.string()};
}

bool Orchestrator::destinationBusyLocked(const std::filesystem::path& dest,
                                         const JobId& except) const {
    const auto wanted = dest.lexically_normal();
    for (const auto& [id, job] : jobs_) {
        if (id != except && !isTerminal(job.status.state) &&
            job.status.destination.lexically_normal() == wanted) {
            return true;
        }
    }
    return false;
}

} // namespace omnifetch::orchestrator
