#include <gtest/gtest.h>

#include <omnifetch/health/health.h>

#include "../../common/test_helpers.h"

using namespace omnifetch;
using namespace omnifetch::health;

namespace {

HealingRecord makeRecord(const std::string& job, const std::string& platform, ErrorClass cls,
                         ActionKind action, HealingOutcome outcome) {
    HealingRecord r;
    r.timestamp = std::chrono::system_clock::now();
    r.jobId = job;
    r.platformId = platform;
    r.errorClass = cls;
    r.actionTaken = action;
    r.outcome = outcome;
    r.message = "msg";
    return r;
}

} // namespace

TEST(HealingLogTest, StatisticsCountOutcomes) {
    HealingLog log;
    log.append(makeRecord("a", "youtube", ErrorClass::Network, ActionKind::Retry,
                          HealingOutcome::RetryScheduled));
    log.append(makeRecord("a", "youtube", ErrorClass::Network, ActionKind::Retry,
                          HealingOutcome::Recovered));
    log.append(makeRecord("b", "vimeo", ErrorClass::EndpointDown, ActionKind::GiveUp,
                          HealingOutcome::Failed));
    log.append(makeRecord("c", "vimeo", ErrorClass::AuthRequired,
                          ActionKind::ManualReviewRequired, HealingOutcome::Failed));

    auto s = log.statistics();
    EXPECT_EQ(s.totalRecords, 4u);
    EXPECT_EQ(s.recovered, 1u);
    EXPECT_EQ(s.failed, 2u);
    EXPECT_NEAR(s.successRate, 1.0 / 3.0, 1e-9);
    EXPECT_EQ(s.byErrorClass[ErrorClass::Network], 1u);
    EXPECT_EQ(s.byErrorClass[ErrorClass::EndpointDown], 1u);
    EXPECT_EQ(s.byPlatform["vimeo"], 2u);
    EXPECT_EQ(s.byPlatform["youtube"], 1u);

    EXPECT_EQ(log.recordsForJob("a").size(), 2u);
}

TEST(HealingLogTest, EmptyLogHasZeroSuccessRate) {
    HealingLog log;
    EXPECT_EQ(log.statistics().successRate, 0.0);
    auto r = log.load();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(HealingLogTest, PersistsAndReloadsSkippingMalformedLines) {
    tests::TempDir dir;
    const auto path = dir / "state" / "healing.jsonl";
    {
        HealingLog log(path);
        log.append(makeRecord("a", "p", ErrorClass::RateLimited, ActionKind::RateLimitWait,
                              HealingOutcome::RetryScheduled));
        log.append(makeRecord("a", "p", ErrorClass::RateLimited, ActionKind::RateLimitWait,
                              HealingOutcome::Recovered));
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "not json\n" << R"({"error_class":"Nope","action":"Retry","outcome":"Failed"})"
            << "\n";
    }

    HealingLog reloaded(path);
    auto n = reloaded.load();
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 2u);
    auto records = reloaded.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].actionTaken, ActionKind::RateLimitWait);
    EXPECT_EQ(records[1].outcome, HealingOutcome::Recovered);
    EXPECT_EQ(records[1].jobId, "a");
}

TEST(HealingLogTest, MissingFileLoadsNothing) {
    tests::TempDir dir;
    HealingLog log(dir / "absent.jsonl");
    auto n = log.load();
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 0u);
}

TEST(HealingLogTest, WrongTypedFieldsAreSkipped) {
    tests::TempDir dir;
    const auto path = dir / "healing.jsonl";
    tests::write_file(path,
                      R"({"error_class":"Network","action":"Retry","outcome":"Recovered",)"
                      R"("endpoint_index":"zero"})"
                      "\n"
                      R"({"error_class":"Network","action":"Retry","outcome":"Recovered",)"
                      R"("job_id":"ok","endpoint_index":1})"
                      "\n");
    HealingLog log(path);
    auto n = log.load();
    ASSERT_TRUE(n);
    EXPECT_EQ(n.value(), 1u);
    EXPECT_EQ(log.records().front().jobId, "ok");
    EXPECT_EQ(log.records().front().endpointIndex, 1u);
}
