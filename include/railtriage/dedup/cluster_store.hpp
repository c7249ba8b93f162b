#pragma once

#include <railtriage/core/cluster.hpp>
#include <railtriage/core/complaint.hpp>
#include <railtriage/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace railtriage::dedup {

/// How a complaint is matched against existing clusters.
struct MatchPolicy {
  /// Nearest active centroid strictly closer than this is a match.
  float match_distance{0.35f};
  /// EMA weight of the new complaint when blending into the centroid.
  float centroid_alpha{0.3f};
  /// Compare against every active cluster of the category, regardless of location.
  /// Unmatched complaints still seed a cluster under the given key.
  bool location_agnostic{false};
};

struct ClusterMatch {
  core::Cluster cluster;  // snapshot after the update
  bool is_new{true};
  float distance{1.f};
};

struct SweepReport {
  std::size_t examined{0};
  std::size_t deactivated{0};
  std::size_t deferred{0};  // buckets that could not be locked in time
};

/// Owned rolling cluster state, the only shared mutable state of the engine.
///
/// Concurrency contract for implementations: operations on distinct keys never block
/// each other; operations on the same key are serialized; every lock acquisition is
/// bounded by `lock_timeout` and reported as TriageError::Timeout when it expires.
/// Clusters are never deleted; aging only clears `active`.
class IClusterStore {
 public:
  virtual ~IClusterStore() = default;

  /// Join the nearest active cluster under `policy`, or create one under `key`.
  [[nodiscard]] virtual std::expected<ClusterMatch, core::TriageError> match_or_create(
      const core::ClusterKey& key,
      const core::FeatureVector& vector,
      const MatchPolicy& policy,
      std::uint64_t complaint_id,
      core::Timestamp at,
      std::chrono::milliseconds lock_timeout) = 0;

  /// Mark clusters with `now - last_seen > inactivity_window` inactive.
  [[nodiscard]] virtual std::expected<SweepReport, core::TriageError> sweep(
      core::Timestamp now,
      core::SystemClock::duration inactivity_window,
      std::chrono::milliseconds lock_timeout) = 0;

  /// Snapshot of every cluster ever created (active and inactive), ordered by id.
  [[nodiscard]] virtual std::vector<core::Cluster> history() const = 0;

  [[nodiscard]] virtual std::optional<core::Cluster> find(std::uint64_t id) const = 0;
};

}  // namespace railtriage::dedup
