#include <railtriage/analytics/decision_log.hpp>
#include <railtriage/analytics/trend_report.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace ra = railtriage::analytics;
namespace rc = railtriage::core;
namespace rr = railtriage::routing;
using namespace std::chrono_literals;

namespace {

const rc::Timestamp kT0 = rc::Timestamp{} + std::chrono::hours(1000);

rc::ComplaintDecision decision(rc::Category c, rc::Department d, float urgency,
                               rc::Sentiment s = rc::Sentiment::Neutral,
                               bool duplicate = false) {
  rc::ComplaintDecision out;
  out.category = c;
  out.department = d;
  out.urgency = urgency;
  out.sentiment = s;
  out.is_new_cluster = !duplicate;
  if (duplicate) out.duplicate_of = 1;
  out.confidence = 0.5f;
  out.processing_ms = 2.0;
  return out;
}

rc::Cluster cluster(std::uint64_t id, std::uint32_t members, rc::Timestamp first,
                    rc::Timestamp last) {
  rc::Cluster c;
  c.id = id;
  c.category = rc::Category::Maintenance;
  c.location_token = "coach-b12";
  c.member_count = members;
  c.first_seen = first;
  c.last_seen = last;
  return c;
}

}  // namespace

TEST(CategoryTrends, MostFrequentFirst) {
  const std::vector<rc::ComplaintDecision> ds = {
      decision(rc::Category::Staff, rc::Department::ServiceQuality, 0.1f),
      decision(rc::Category::Maintenance, rc::Department::Maintenance, 0.1f),
      decision(rc::Category::Maintenance, rc::Department::Maintenance, 0.1f),
      decision(rc::Category::Cleanliness, rc::Department::Housekeeping, 0.1f),
  };
  const auto trends = ra::category_trends(ds);
  ASSERT_EQ(trends.size(), 3u);
  EXPECT_EQ(trends[0].category, rc::Category::Maintenance);
  EXPECT_EQ(trends[0].count, 2u);
  EXPECT_DOUBLE_EQ(trends[0].percentage, 50.0);
  // Tie broken by enum order.
  EXPECT_EQ(trends[1].category, rc::Category::Cleanliness);
  EXPECT_EQ(trends[2].category, rc::Category::Staff);
}

TEST(CategoryTrends, EmptyInput) {
  EXPECT_TRUE(ra::category_trends({}).empty());
}

TEST(DepartmentStats, Percentages) {
  const std::vector<rc::ComplaintDecision> ds = {
      decision(rc::Category::Safety, rc::Department::Safety, 0.9f, rc::Sentiment::Negative),
      decision(rc::Category::Safety, rc::Department::Safety, 0.3f, rc::Sentiment::Neutral, true),
      decision(rc::Category::Staff, rc::Department::ServiceQuality, 0.8f),
  };
  const auto stats = ra::department_stats(ds);
  ASSERT_EQ(stats.size(), 2u);
  EXPECT_EQ(stats[0].department, rc::Department::Safety);
  EXPECT_EQ(stats[0].total, 2u);
  EXPECT_DOUBLE_EQ(stats[0].high_urgency_percentage, 50.0);
  EXPECT_DOUBLE_EQ(stats[0].negative_sentiment_percentage, 50.0);
  EXPECT_DOUBLE_EQ(stats[0].recurring_percentage, 50.0);
  EXPECT_EQ(stats[1].department, rc::Department::ServiceQuality);
  EXPECT_DOUBLE_EQ(stats[1].high_urgency_percentage, 100.0);
}

TEST(UrgencyDistribution, OneBucketPerTier) {
  const std::vector<rc::ComplaintDecision> ds = {
      decision(rc::Category::Safety, rc::Department::Safety, 0.95f),
      decision(rc::Category::Staff, rc::Department::ServiceQuality, 0.5f),
      decision(rc::Category::Staff, rc::Department::ServiceQuality, 0.2f),
      decision(rc::Category::Other, rc::Department::GeneralAdministration, 0.f),
  };
  const auto buckets = ra::urgency_distribution(ds, rr::default_routing_policy().tiers);
  ASSERT_EQ(buckets.size(), 3u);
  EXPECT_FLOAT_EQ(buckets[0].min_urgency, 0.8f);
  EXPECT_EQ(buckets[0].count, 1u);
  EXPECT_EQ(buckets[1].count, 1u);
  EXPECT_EQ(buckets[2].count, 2u);
  EXPECT_DOUBLE_EQ(buckets[2].percentage, 50.0);
}

TEST(UrgencyDistribution, EmptyDecisionsKeepBuckets) {
  const auto buckets = ra::urgency_distribution({}, rr::default_routing_policy().tiers);
  ASSERT_EQ(buckets.size(), 3u);
  for (const auto& b : buckets) {
    EXPECT_EQ(b.count, 0u);
    EXPECT_DOUBLE_EQ(b.percentage, 0.0);
  }
}

TEST(PerformanceSummary, Averages) {
  std::vector<rc::ComplaintDecision> ds = {
      decision(rc::Category::Safety, rc::Department::Safety, 0.9f),
      decision(rc::Category::Staff, rc::Department::ServiceQuality, 0.2f, rc::Sentiment::Neutral,
               true),
  };
  ds[0].confidence = 1.f;
  ds[1].confidence = 0.f;
  ds[1].processing_ms = 4.0;
  ds[1].quality.ocr_degraded = true;
  const auto s = ra::performance_summary(ds);
  EXPECT_EQ(s.total, 2u);
  EXPECT_DOUBLE_EQ(s.average_confidence, 0.5);
  EXPECT_DOUBLE_EQ(s.average_processing_ms, 3.0);
  EXPECT_EQ(s.degraded, 1u);
  EXPECT_EQ(s.duplicates, 1u);
}

TEST(PerformanceSummary, EmptyIsZero) {
  const auto s = ra::performance_summary({});
  EXPECT_EQ(s.total, 0u);
  EXPECT_DOUBLE_EQ(s.average_confidence, 0.0);
}

TEST(PredictRecurringIssues, MeanIntervalAndOrdering) {
  const std::vector<rc::Cluster> history = {
      cluster(1, 3, kT0, kT0 + 4h),
      cluster(2, 1, kT0, kT0),
      cluster(3, 5, kT0, kT0 + 8h),
  };
  const auto issues = ra::predict_recurring_issues(history);
  ASSERT_EQ(issues.size(), 2u);
  EXPECT_EQ(issues[0].cluster_id, 3u);
  EXPECT_EQ(issues[0].mean_interval, std::chrono::duration_cast<rc::SystemClock::duration>(2h));
  EXPECT_EQ(issues[0].predicted_next, kT0 + 10h);
  EXPECT_EQ(issues[1].cluster_id, 1u);
  EXPECT_EQ(issues[1].predicted_next, kT0 + 6h);
}

TEST(PredictRecurringIssues, NeedsAtLeastTwoMembers) {
  const std::vector<rc::Cluster> history = {cluster(1, 1, kT0, kT0), cluster(2, 2, kT0, kT0 + 1h)};
  const auto issues = ra::predict_recurring_issues(history, 0);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].cluster_id, 2u);
}

TEST(DecisionLog, KeepsPublishedDecisions) {
  ra::DecisionLog log;
  ASSERT_TRUE(log.publish(decision(rc::Category::Staff, rc::Department::ServiceQuality, 0.1f))
                  .has_value());
  EXPECT_EQ(log.size(), 1u);
  EXPECT_EQ(log.snapshot()[0].category, rc::Category::Staff);
  log.clear();
  EXPECT_EQ(log.size(), 0u);
}

TEST(DecisionLog, CapacityDropsOldest) {
  ra::DecisionLog log(2);
  for (std::uint64_t id = 1; id <= 3; ++id) {
    auto d = decision(rc::Category::Other, rc::Department::GeneralAdministration, 0.f);
    d.complaint_id = id;
    ASSERT_TRUE(log.publish(d).has_value());
  }
  const auto snap = log.snapshot();
  ASSERT_EQ(snap.size(), 2u);
  EXPECT_EQ(snap[0].complaint_id, 2u);
  EXPECT_EQ(snap[1].complaint_id, 3u);
}

TEST(DecisionLog, ConcurrentPublish) {
  ra::DecisionLog log;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&log] {
      for (int i = 0; i < 100; ++i) {
        (void)log.publish(decision(rc::Category::Other, rc::Department::GeneralAdministration, 0.f));
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(log.size(), 400u);
}
