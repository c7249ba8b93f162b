#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/dedup/cluster_store.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace railtriage::dedup {

/// Process-local IClusterStore.
///
/// Locking: one shard per category holding a std::shared_timed_mutex, and one
/// std::timed_mutex per (category, location) bucket. Keyed operations take the shard
/// shared and their bucket exclusively; location-agnostic matching takes the shard
/// exclusively (which excludes every keyed operation and sweep of that category).
/// Buckets are created on first use and never removed.
class InMemoryClusterStore : public IClusterStore {
 public:
  InMemoryClusterStore() = default;
  InMemoryClusterStore(const InMemoryClusterStore&) = delete;
  InMemoryClusterStore& operator=(const InMemoryClusterStore&) = delete;

  [[nodiscard]] std::expected<ClusterMatch, core::TriageError> match_or_create(
      const core::ClusterKey& key,
      const core::FeatureVector& vector,
      const MatchPolicy& policy,
      std::uint64_t complaint_id,
      core::Timestamp at,
      std::chrono::milliseconds lock_timeout) override;

  [[nodiscard]] std::expected<SweepReport, core::TriageError> sweep(
      core::Timestamp now,
      core::SystemClock::duration inactivity_window,
      std::chrono::milliseconds lock_timeout) override;

  [[nodiscard]] std::vector<core::Cluster> history() const override;
  [[nodiscard]] std::optional<core::Cluster> find(std::uint64_t id) const override;

  [[nodiscard]] std::size_t size() const;

  /// Test hook: hold the bucket of `key` locked until the returned guard is destroyed.
  [[nodiscard]] std::unique_lock<std::timed_mutex> lock_bucket(const core::ClusterKey& key);

 private:
  struct Bucket {
    std::timed_mutex mutex;
    std::vector<core::Cluster> clusters;
  };

  struct Shard {
    mutable std::shared_timed_mutex mutex;
    mutable std::mutex map_mutex;  // guards `buckets` (the map, not the bucket contents)
    std::unordered_map<std::string, std::unique_ptr<Bucket>> buckets;
  };

  Bucket& bucket_for(Shard& shard, const std::string& location);
  /// Stable snapshot of the shard's bucket pointers (buckets are never removed).
  static std::vector<Bucket*> buckets_of(const Shard& shard);
  core::Cluster create_cluster(Bucket& bucket, const core::ClusterKey& key,
                               const core::FeatureVector& vector, std::uint64_t complaint_id,
                               core::Timestamp at);
  static void join(core::Cluster& cluster, const core::FeatureVector& vector,
                   float alpha, core::Timestamp at);

  std::expected<ClusterMatch, core::TriageError> match_keyed(
      Shard& shard, const core::ClusterKey& key, const core::FeatureVector& vector,
      const MatchPolicy& policy, std::uint64_t complaint_id, core::Timestamp at,
      std::chrono::milliseconds lock_timeout);
  std::expected<ClusterMatch, core::TriageError> match_any_location(
      Shard& shard, const core::ClusterKey& key, const core::FeatureVector& vector,
      const MatchPolicy& policy, std::uint64_t complaint_id, core::Timestamp at,
      std::chrono::milliseconds lock_timeout);

  std::array<Shard, core::kCategoryCount> shards_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace railtriage::dedup
