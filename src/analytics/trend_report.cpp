#include <railtriage/analytics/trend_report.hpp>
#include <algorithm>
#include <array>

namespace railtriage::analytics {

namespace {

double percent(std::size_t part, std::size_t whole) {
  return whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

constexpr std::size_t kDepartmentCount = 5;

}  // namespace

std::vector<CategoryTrend> category_trends(std::span<const core::ComplaintDecision> decisions) {
  std::array<std::size_t, core::kCategoryCount> counts{};
  for (const auto& d : decisions) ++counts[core::index_of(d.category)];

  std::vector<CategoryTrend> out;
  for (auto c : core::kAllCategories) {
    const auto n = counts[core::index_of(c)];
    if (n > 0) out.push_back({c, n, percent(n, decisions.size())});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const CategoryTrend& a, const CategoryTrend& b) { return a.count > b.count; });
  return out;
}

std::vector<DepartmentStats> department_stats(std::span<const core::ComplaintDecision> decisions,
                                              float high_urgency) {
  struct Acc {
    std::size_t total{0};
    std::size_t high{0};
    std::size_t negative{0};
    std::size_t recurring{0};
  };
  std::array<Acc, kDepartmentCount> acc{};
  for (const auto& d : decisions) {
    auto& a = acc[static_cast<std::size_t>(d.department)];
    ++a.total;
    if (d.urgency >= high_urgency) ++a.high;
    if (d.sentiment == core::Sentiment::Negative) ++a.negative;
    if (d.duplicate_of.has_value()) ++a.recurring;
  }

  std::vector<DepartmentStats> out;
  for (std::size_t i = 0; i < kDepartmentCount; ++i) {
    const auto& a = acc[i];
    if (a.total == 0) continue;
    DepartmentStats s;
    s.department = static_cast<core::Department>(i);
    s.total = a.total;
    s.high_urgency_percentage = percent(a.high, a.total);
    s.negative_sentiment_percentage = percent(a.negative, a.total);
    s.recurring_percentage = percent(a.recurring, a.total);
    out.push_back(s);
  }
  return out;
}

std::vector<UrgencyBucket> urgency_distribution(std::span<const core::ComplaintDecision> decisions,
                                                const std::vector<routing::UrgencyTier>& tiers) {
  std::vector<routing::UrgencyTier> sorted = tiers;
  std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
    return a.min_urgency > b.min_urgency;
  });

  std::vector<UrgencyBucket> out;
  out.reserve(sorted.size());
  for (const auto& t : sorted) out.push_back({t.min_urgency, 0, 0.0});
  if (out.empty()) return out;

  for (const auto& d : decisions) {
    auto it = std::find_if(out.begin(), out.end(),
                           [&d](const UrgencyBucket& b) { return d.urgency >= b.min_urgency; });
    if (it == out.end()) it = out.end() - 1;
    ++it->count;
  }
  for (auto& b : out) b.percentage = percent(b.count, decisions.size());
  return out;
}

PerformanceSummary performance_summary(std::span<const core::ComplaintDecision> decisions) {
  PerformanceSummary s;
  s.total = decisions.size();
  if (s.total == 0) return s;
  double confidence = 0.0;
  double ms = 0.0;
  for (const auto& d : decisions) {
    confidence += d.confidence;
    ms += d.processing_ms;
    if (d.quality.degraded()) ++s.degraded;
    if (!d.is_new_cluster) ++s.duplicates;
  }
  s.average_confidence = confidence / static_cast<double>(s.total);
  s.average_processing_ms = ms / static_cast<double>(s.total);
  return s;
}

std::vector<RecurringIssue> predict_recurring_issues(const std::vector<core::Cluster>& history,
                                                     std::uint32_t min_members) {
  std::vector<RecurringIssue> out;
  for (const auto& c : history) {
    if (c.member_count < std::max<std::uint32_t>(min_members, 2)) continue;
    RecurringIssue r;
    r.cluster_id = c.id;
    r.category = c.category;
    r.location_token = c.location_token;
    r.member_count = c.member_count;
    r.first_seen = c.first_seen;
    r.last_seen = c.last_seen;
    r.mean_interval = (c.last_seen - c.first_seen) / static_cast<int>(c.member_count - 1);
    r.predicted_next = c.last_seen + r.mean_interval;
    r.active = c.active;
    out.push_back(std::move(r));
  }
  std::stable_sort(out.begin(), out.end(), [](const RecurringIssue& a, const RecurringIssue& b) {
    return a.member_count > b.member_count;
  });
  return out;
}

}  // namespace railtriage::analytics
