#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/core/complaint.hpp>
#include <railtriage/core/error.hpp>
#include <railtriage/core/outcome.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <vector>

namespace railtriage::routing {

/// Urgency at or above `min_urgency` divides the base SLA window by `multiplier`.
struct UrgencyTier {
  float min_urgency{0.f};
  float multiplier{1.f};
};

struct RoutingPolicy {
  std::map<core::Category, core::Department> departments;
  std::map<core::Category, std::chrono::minutes> base_windows;
  /// Sorted by min_urgency descending; the last tier should start at 0.
  std::vector<UrgencyTier> tiers;
  /// A matched cluster with at least this many members escalates one tier.
  std::uint32_t repetition_threshold{2};
};

/// Category -> department, base windows Cleanliness 6h, Maintenance 12h, Safety 2h,
/// Staff 24h, Other 48h; tiers 0.8:x4, 0.5:x2, 0:x1.
[[nodiscard]] RoutingPolicy default_routing_policy();

/// Sorts tiers descending and checks them: non-empty, min_urgency in [0,1], distinct
/// breakpoints, multipliers >= 1 and non-decreasing with urgency.
[[nodiscard]] std::expected<std::vector<UrgencyTier>, core::TriageError> normalize_tiers(
    std::vector<UrgencyTier> tiers);

struct RecurrenceInfo {
  bool is_new_cluster{true};
  std::uint32_t member_count{1};
};

/// Deterministic (category, urgency, recurrence) -> (department, SLA deadline).
/// Stateless apart from the immutable policy; safe to share across threads.
class Router {
 public:
  /// \throws std::invalid_argument if the tiers are not valid (see normalize_tiers).
  explicit Router(RoutingPolicy policy = default_routing_policy());

  /// Fails with UnknownCategory when the category has no department or base window.
  [[nodiscard]] std::expected<core::RoutingDecision, core::TriageError> route(
      core::Category category,
      float urgency,
      RecurrenceInfo recurrence,
      core::Timestamp submitted_at) const;

  /// Index of the tier `urgency` falls in (0 = most urgent).
  [[nodiscard]] std::size_t tier_index(float urgency) const noexcept;

  [[nodiscard]] const RoutingPolicy& policy() const noexcept { return policy_; }

 private:
  RoutingPolicy policy_;
};

}  // namespace railtriage::routing
