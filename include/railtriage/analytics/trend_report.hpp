#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/core/cluster.hpp>
#include <railtriage/core/complaint.hpp>
#include <railtriage/routing/router.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace railtriage::analytics {

/// Read-only aggregations over the decision stream and cluster history.
/// Percentages are in [0, 100]; empty input yields zeros, never NaN.

struct CategoryTrend {
  core::Category category{core::Category::Other};
  std::size_t count{0};
  double percentage{0.0};
};

/// Categories present in `decisions`, most frequent first (ties in enum order).
[[nodiscard]] std::vector<CategoryTrend> category_trends(
    std::span<const core::ComplaintDecision> decisions);

struct DepartmentStats {
  core::Department department{core::Department::GeneralAdministration};
  std::size_t total{0};
  double high_urgency_percentage{0.0};
  double negative_sentiment_percentage{0.0};
  double recurring_percentage{0.0};
};

/// One row per department present, in enum order. "High urgency" is urgency >= `high_urgency`.
[[nodiscard]] std::vector<DepartmentStats> department_stats(
    std::span<const core::ComplaintDecision> decisions, float high_urgency = 0.8f);

struct UrgencyBucket {
  float min_urgency{0.f};
  std::size_t count{0};
  double percentage{0.0};
};

/// One bucket per tier (most urgent first), including empty ones.
[[nodiscard]] std::vector<UrgencyBucket> urgency_distribution(
    std::span<const core::ComplaintDecision> decisions,
    const std::vector<routing::UrgencyTier>& tiers);

struct PerformanceSummary {
  std::size_t total{0};
  double average_confidence{0.0};
  double average_processing_ms{0.0};
  std::size_t degraded{0};
  std::size_t duplicates{0};
};

[[nodiscard]] PerformanceSummary performance_summary(
    std::span<const core::ComplaintDecision> decisions);

struct RecurringIssue {
  std::uint64_t cluster_id{0};
  core::Category category{core::Category::Other};
  std::string location_token;
  std::uint32_t member_count{0};
  core::Timestamp first_seen{};
  core::Timestamp last_seen{};
  core::SystemClock::duration mean_interval{};
  core::Timestamp predicted_next{};  // last_seen + mean_interval
  bool active{true};
};

/// Clusters with at least `min_members` members, largest first. The next occurrence
/// is a naive estimate from the mean inter-arrival time.
[[nodiscard]] std::vector<RecurringIssue> predict_recurring_issues(
    const std::vector<core::Cluster>& history, std::uint32_t min_members = 3);

}  // namespace railtriage::analytics
