#include <gtest/gtest.h>

#include <omnifetch/health/health.h>

#include "../../common/test_helpers.h"

#include <cstdint>
#include <limits>

using namespace omnifetch;
using namespace omnifetch::health;
using namespace std::chrono_literals;

namespace {

HealthPolicy quietPolicy(int maxAttempts = 6) {
    HealthPolicy p;
    p.backoff.baseDelay = 100ms;
    p.backoff.maxDelay = 1000ms;
    p.backoff.jitter = false;
    p.maxAttemptsPerJob = maxAttempts;
    return p;
}

JobContext makeJob(std::size_t endpoints = 1) {
    JobContext job;
    job.jobId = "job-7";
    job.platformId = "mirrorhub";
    job.endpointCount = endpoints;
    job.attemptCount = 1;
    return job;
}

FailureInfo failure(ErrorCode code, std::optional<int> status = std::nullopt) {
    return FailureInfo{Error{code, "boom"}, status, std::nullopt};
}

} // namespace

TEST(ClassifyTest, StatusAndCodeMapping) {
    EXPECT_EQ(classify(failure(ErrorCode::NetworkError)), ErrorClass::Network);
    EXPECT_EQ(classify(failure(ErrorCode::TransferIncomplete)), ErrorClass::Network);
    EXPECT_EQ(classify(failure(ErrorCode::Timeout)), ErrorClass::Timeout);
    EXPECT_EQ(classify(failure(ErrorCode::EndpointDown, 404)), ErrorClass::EndpointDown);
    EXPECT_EQ(classify(failure(ErrorCode::EndpointDown, 503)), ErrorClass::EndpointDown);
    EXPECT_EQ(classify(failure(ErrorCode::RateLimited, 429)), ErrorClass::RateLimited);
    EXPECT_EQ(classify(failure(ErrorCode::AuthRequired, 401)), ErrorClass::AuthRequired);
    EXPECT_EQ(classify(failure(ErrorCode::AuthRequired, 403)), ErrorClass::AuthRequired);
    EXPECT_EQ(classify(failure(ErrorCode::Timeout, 408)), ErrorClass::Timeout);
    EXPECT_EQ(classify(failure(ErrorCode::ChecksumMismatch, 200)), ErrorClass::ChecksumMismatch);
    EXPECT_EQ(classify(failure(ErrorCode::PatternStale)), ErrorClass::PatternStale);
    // A transport drop after a 206 is still a network failure
    EXPECT_EQ(classify(failure(ErrorCode::NetworkError, 206)), ErrorClass::Network);
    EXPECT_EQ(classify(failure(ErrorCode::IoError)), ErrorClass::Network);
}

TEST(ClassifyTest, NamesRoundTrip) {
    EXPECT_EQ(parse_error_class("AllEndpointsExhausted"), ErrorClass::AllEndpointsExhausted);
    EXPECT_FALSE(parse_error_class("Bogus").has_value());
    EXPECT_EQ(parse_action_kind("CleanRestart"), ActionKind::CleanRestart);
    EXPECT_EQ(parse_healing_outcome("Recovered"), HealingOutcome::Recovered);
    EXPECT_EQ(toErrorCode(ErrorClass::PatternStale), ErrorCode::PatternStale);
}

TEST(BackoffTest, GrowsMonotonicallyToCap) {
    BackoffPolicy p{100ms, 1000ms, false};
    EXPECT_EQ(backoffCeiling(p, 0), 100ms);
    EXPECT_EQ(backoffCeiling(p, 1), 200ms);
    EXPECT_EQ(backoffCeiling(p, 3), 800ms);
    EXPECT_EQ(backoffCeiling(p, 4), 1000ms);
    EXPECT_EQ(backoffCeiling(p, 60), 1000ms);
    auto prev = backoffCeiling(p, 0);
    for (int i = 1; i < 40; ++i) {
        auto next = backoffCeiling(p, i);
        EXPECT_GE(next, prev);
        EXPECT_LE(next, p.maxDelay);
        prev = next;
    }
}

TEST(BackoffTest, HugeMaxDelaySaturatesInsteadOfOverflowing) {
    const std::chrono::milliseconds huge{std::numeric_limits<std::int64_t>::max()};
    BackoffPolicy p{3ms, huge, false};
    auto prev = backoffCeiling(p, 0);
    for (int i = 1; i < 200; ++i) {
        auto next = backoffCeiling(p, i);
        EXPECT_GT(next.count(), 0) << "attempt " << i;
        EXPECT_GE(next, prev);
        prev = next;
    }
    EXPECT_EQ(backoffCeiling(p, 200), huge);

    auto policy = quietPolicy();
    policy.backoff = BackoffPolicy{3ms, huge, true};
    HealthController ctl(policy, nullptr, nullptr, 99);
    EXPECT_EQ(ctl.backoffDelay(200), huge);
}

TEST(BackoffTest, JitterStaysBelowOneBaseDelay) {
    auto policy = quietPolicy();
    policy.backoff.jitter = true;
    HealthController ctl(policy, nullptr, nullptr, 1234);
    for (int i = 0; i < 50; ++i) {
        auto d = ctl.backoffDelay(2);
        EXPECT_GE(d, 400ms);
        EXPECT_LT(d, 500ms);
    }
}

TEST(EndpointHealthTest, UnhealthyMarkExpiresAfterCooldown) {
    EndpointHealthStore store(10s);
    const auto t0 = std::chrono::system_clock::now();
    store.recordFailure("p", 0, true, t0);
    store.recordFailure("p", 1, false, t0);

    EXPECT_FALSE(store.isHealthy("p", 0, t0 + 5s));
    EXPECT_TRUE(store.isHealthy("p", 0, t0 + 10s));
    EXPECT_TRUE(store.isHealthy("p", 1, t0));
    EXPECT_EQ(store.get("p", 1).consecutiveFailures, 1);

    EXPECT_EQ(store.preferredIndex("p", 3, t0 + 1s), 1u);
    store.recordFailure("p", 1, true, t0);
    store.recordFailure("p", 2, true, t0);
    EXPECT_EQ(store.preferredIndex("p", 3, t0 + 1s), 0u);

    store.recordSuccess("p", 0, t0 + 2s);
    EXPECT_TRUE(store.get("p", 0).lastKnownGood);
    EXPECT_EQ(store.get("p", 0).consecutiveFailures, 0);
    EXPECT_EQ(store.snapshot().size(), 3u);
}

TEST(HealthControllerTest, TransientFailuresRetryWithBackoff) {
    HealthController ctl(quietPolicy(), nullptr, nullptr);
    auto job = makeJob();
    job.retryCount = 2;
    auto a = ctl.decide(job, ErrorClass::Network);
    EXPECT_EQ(a.kind, ActionKind::Retry);
    EXPECT_EQ(a.delay, 400ms);
    EXPECT_EQ(a.endpointIndex, 0u);
    EXPECT_FALSE(a.terminal());

    auto t = ctl.decide(job, ErrorClass::Timeout);
    EXPECT_EQ(t.kind, ActionKind::Retry);
}

TEST(HealthControllerTest, RateLimitHonorsRetryAfterAndRotatesAgent) {
    HealthController ctl(quietPolicy(), nullptr, nullptr);
    auto job = makeJob();
    job.retryAfter = 2s;
    auto first = ctl.decide(job, ErrorClass::RateLimited);
    EXPECT_EQ(first.kind, ActionKind::RateLimitWait);
    EXPECT_EQ(first.delay, 2000ms);
    ASSERT_TRUE(first.userAgent);

    job.retryAfter.reset();
    auto second = ctl.decide(job, ErrorClass::RateLimited);
    EXPECT_EQ(second.delay, 100ms);
    ASSERT_TRUE(second.userAgent);
    EXPECT_NE(*first.userAgent, *second.userAgent);
}

TEST(HealthControllerTest, EndpointDownWalksCandidatesThenExhausts) {
    auto health = std::make_shared<EndpointHealthStore>();
    HealthController ctl(quietPolicy(10), health, nullptr);
    auto job = makeJob(3);

    auto a = ctl.decide(job, ErrorClass::EndpointDown);
    ASSERT_EQ(a.kind, ActionKind::SwitchEndpoint);
    EXPECT_EQ(a.endpointIndex, 1u);
    EXPECT_EQ(a.delay, 0ms);
    EXPECT_FALSE(health->isHealthy("mirrorhub", 0));

    job.failedEndpoints.insert(0);
    job.activeEndpointIndex = 1;
    job.attemptCount = 2;
    auto b = ctl.decide(job, ErrorClass::EndpointDown);
    ASSERT_EQ(b.kind, ActionKind::SwitchEndpoint);
    EXPECT_EQ(b.endpointIndex, 2u);

    job.failedEndpoints.insert(1);
    job.activeEndpointIndex = 2;
    job.attemptCount = 3;
    auto c = ctl.decide(job, ErrorClass::EndpointDown);
    EXPECT_EQ(c.kind, ActionKind::GiveUp);
    EXPECT_EQ(c.terminalClass, ErrorClass::AllEndpointsExhausted);
    EXPECT_TRUE(c.terminal());
}

TEST(HealthControllerTest, SwitchWrapsAroundFromLaterStart) {
    HealthController ctl(quietPolicy(), nullptr, nullptr);
    auto job = makeJob(3);
    job.activeEndpointIndex = 2;
    auto a = ctl.decide(job, ErrorClass::EndpointDown);
    ASSERT_EQ(a.kind, ActionKind::SwitchEndpoint);
    EXPECT_EQ(a.endpointIndex, 0u);
}

TEST(HealthControllerTest, SingleEndpointDownIsExhaustion) {
    HealthController ctl(quietPolicy(), nullptr, nullptr);
    auto a = ctl.decide(makeJob(1), ErrorClass::EndpointDown);
    EXPECT_EQ(a.kind, ActionKind::GiveUp);
    EXPECT_EQ(a.terminalClass, ErrorClass::AllEndpointsExhausted);
}

TEST(HealthControllerTest, ChecksumMismatchRestartsOnceThenNeedsReview) {
    HealthController ctl(quietPolicy(), nullptr, nullptr);
    auto job = makeJob();
    auto first = ctl.decide(job, ErrorClass::ChecksumMismatch);
    EXPECT_EQ(first.kind, ActionKind::CleanRestart);
    job.checksumRestarts = 1;
    auto second = ctl.decide(job, ErrorClass::ChecksumMismatch);
    EXPECT_EQ(second.kind, ActionKind::ManualReviewRequired);
    EXPECT_EQ(second.terminalClass, ErrorClass::ChecksumMismatch);
}

TEST(HealthControllerTest, NonRetryableClassesNeedReview) {
    HealthController ctl(quietPolicy(), nullptr, nullptr);
    EXPECT_EQ(ctl.decide(makeJob(), ErrorClass::AuthRequired).kind,
              ActionKind::ManualReviewRequired);
    EXPECT_EQ(ctl.decide(makeJob(), ErrorClass::PatternStale).kind,
              ActionKind::ManualReviewRequired);
    EXPECT_EQ(ctl.decide(makeJob(), ErrorClass::PlatformUnresolved).kind,
              ActionKind::ManualReviewRequired);
}

TEST(HealthControllerTest, AttemptCeilingGivesUp) {
    HealthController ctl(quietPolicy(3), nullptr, nullptr);
    auto job = makeJob(5);
    job.attemptCount = 3;
    auto net = ctl.decide(job, ErrorClass::Network);
    EXPECT_EQ(net.kind, ActionKind::GiveUp);
    EXPECT_EQ(net.terminalClass, ErrorClass::Network);
    EXPECT_EQ(ctl.decide(job, ErrorClass::EndpointDown).kind, ActionKind::GiveUp);
    EXPECT_EQ(ctl.decide(job, ErrorClass::RateLimited).kind, ActionKind::GiveUp);
}

TEST(HealthControllerTest, EveryDecisionIsLogged) {
    auto log = std::make_shared<HealingLog>();
    HealthController ctl(quietPolicy(), nullptr, log);
    auto job = makeJob(2);
    job.message = "HTTP 404";
    ctl.decide(job, ErrorClass::EndpointDown);
    job.activeEndpointIndex = 1;
    job.attemptCount = 2;
    ctl.recordSuccess(job, true);

    auto records = log->recordsForJob("job-7");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].errorClass, ErrorClass::EndpointDown);
    EXPECT_EQ(records[0].actionTaken, ActionKind::SwitchEndpoint);
    EXPECT_EQ(records[0].outcome, HealingOutcome::RetryScheduled);
    EXPECT_NE(records[0].message.find("HTTP 404"), std::string::npos);
    EXPECT_EQ(records[1].outcome, HealingOutcome::Recovered);
    EXPECT_EQ(records[1].endpointIndex, 1u);

    // A first-try success leaves no record
    ctl.recordSuccess(makeJob(), false);
    EXPECT_EQ(log->size(), 2u);
}

TEST(HealthControllerTest, PreferredEndpointSkipsUnhealthy) {
    auto health = std::make_shared<EndpointHealthStore>(1h);
    HealthController ctl(quietPolicy(), health, nullptr);
    health->recordFailure("mirrorhub", 0, true);
    EXPECT_EQ(ctl.preferredEndpoint("mirrorhub", 2), 1u);
    EXPECT_EQ(ctl.preferredEndpoint("other", 2), 0u);
}
