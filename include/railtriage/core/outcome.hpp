#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/core/cluster.hpp>
#include <railtriage/core/complaint.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace railtriage::core {

/// Result of the deduplication step. A missing cluster means the store was not
/// consulted or failed; is_new_cluster is then true.
struct DedupOutcome {
  std::optional<Cluster> cluster;  // snapshot after the update
  bool is_new_cluster{true};
  float distance{1.f};             // distance to the matched centroid (1 when new)
  bool degraded{false};
};

/// Result of the routing step.
struct RoutingDecision {
  Department department{Department::GeneralAdministration};
  Timestamp sla_deadline{};
  float effective_urgency{0.f};  // urgency after recurrence escalation
  float multiplier{1.f};
  std::size_t tier_index{0};     // 0 = most urgent tier
  bool escalated{false};
};

}  // namespace railtriage::core
