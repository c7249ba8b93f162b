#include <railtriage/routing/router.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace railtriage::routing {

using core::Category;
using core::Department;
using std::chrono::hours;

RoutingPolicy default_routing_policy() {
  RoutingPolicy p;
  p.departments = {
      {Category::Cleanliness, Department::Housekeeping},
      {Category::Maintenance, Department::Maintenance},
      {Category::Safety, Department::Safety},
      {Category::Staff, Department::ServiceQuality},
      {Category::Other, Department::GeneralAdministration},
  };
  p.base_windows = {
      {Category::Cleanliness, hours(6)},
      {Category::Maintenance, hours(12)},
      {Category::Safety, hours(2)},
      {Category::Staff, hours(24)},
      {Category::Other, hours(48)},
  };
  p.tiers = {{0.8f, 4.f}, {0.5f, 2.f}, {0.f, 1.f}};
  return p;
}

std::expected<std::vector<UrgencyTier>, core::TriageError> normalize_tiers(
    std::vector<UrgencyTier> tiers) {
  if (tiers.empty()) return std::unexpected(core::TriageError::InvalidConfig);
  std::sort(tiers.begin(), tiers.end(), [](const UrgencyTier& a, const UrgencyTier& b) {
    return a.min_urgency > b.min_urgency;
  });
  for (std::size_t i = 0; i < tiers.size(); ++i) {
    const auto& t = tiers[i];
    if (t.min_urgency < 0.f || t.min_urgency > 1.f || t.multiplier < 1.f) {
      return std::unexpected(core::TriageError::InvalidConfig);
    }
    if (i > 0) {
      const auto& higher = tiers[i - 1];
      if (higher.min_urgency == t.min_urgency || higher.multiplier < t.multiplier) {
        return std::unexpected(core::TriageError::InvalidConfig);
      }
    }
  }
  return tiers;
}

Router::Router(RoutingPolicy policy) : policy_(std::move(policy)) {
  auto tiers = normalize_tiers(std::move(policy_.tiers));
  if (!tiers) {
    throw std::invalid_argument("Router: urgency tiers must be non-empty and monotonic");
  }
  policy_.tiers = std::move(*tiers);
}

std::size_t Router::tier_index(float urgency) const noexcept {
  for (std::size_t i = 0; i < policy_.tiers.size(); ++i) {
    if (urgency >= policy_.tiers[i].min_urgency) return i;
  }
  return policy_.tiers.size() - 1;
}

std::expected<core::RoutingDecision, core::TriageError> Router::route(
    Category category,
    float urgency,
    RecurrenceInfo recurrence,
    core::Timestamp submitted_at) const {
  const auto dept = policy_.departments.find(category);
  const auto window = policy_.base_windows.find(category);
  if (dept == policy_.departments.end() || window == policy_.base_windows.end()) {
    spdlog::error("no routing entry for category '{}'", core::to_string(category));
    return std::unexpected(core::TriageError::UnknownCategory);
  }

  core::RoutingDecision out;
  out.department = dept->second;
  out.effective_urgency = std::clamp(urgency, 0.f, 1.f);
  out.tier_index = tier_index(out.effective_urgency);

  const bool recurring = !recurrence.is_new_cluster &&
                         recurrence.member_count >= policy_.repetition_threshold;
  if (recurring && out.tier_index > 0) {
    --out.tier_index;
    out.escalated = true;
    out.effective_urgency = std::max(out.effective_urgency,
                                     policy_.tiers[out.tier_index].min_urgency);
  }

  out.multiplier = policy_.tiers[out.tier_index].multiplier;
  const auto base = std::chrono::duration_cast<core::SystemClock::duration>(window->second);
  out.sla_deadline = submitted_at + std::chrono::duration_cast<core::SystemClock::duration>(
                                        base / static_cast<double>(out.multiplier));
  return out;
}

}  // namespace railtriage::routing
