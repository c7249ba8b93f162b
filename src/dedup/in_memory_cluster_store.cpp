#include <railtriage/dedup/in_memory_cluster_store.hpp>
#include <railtriage/dedup/centroid.hpp>
#include <algorithm>
#include <limits>

namespace railtriage::dedup {

namespace {

using SteadyClock = std::chrono::steady_clock;

/// Time left until `deadline`, never negative.
std::chrono::milliseconds left(SteadyClock::time_point deadline) {
  const auto d = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
  return std::max(d, std::chrono::milliseconds(0));
}

struct Nearest {
  core::Cluster* cluster{nullptr};
  float distance{std::numeric_limits<float>::max()};
};

void consider(std::vector<core::Cluster>& clusters, const core::FeatureVector& vector,
              Nearest& best) {
  for (auto& c : clusters) {
    if (!c.active) continue;
    const float d = cosine_distance(c.centroid, vector);
    if (d < best.distance || (d == best.distance && best.cluster && c.id < best.cluster->id)) {
      best.cluster = &c;
      best.distance = d;
    }
  }
}

}  // namespace

InMemoryClusterStore::Bucket& InMemoryClusterStore::bucket_for(Shard& shard,
                                                               const std::string& location) {
  std::lock_guard lock(shard.map_mutex);
  auto& slot = shard.buckets[location];
  if (!slot) slot = std::make_unique<Bucket>();
  return *slot;
}

std::vector<InMemoryClusterStore::Bucket*> InMemoryClusterStore::buckets_of(const Shard& shard) {
  std::lock_guard lock(shard.map_mutex);
  std::vector<Bucket*> out;
  out.reserve(shard.buckets.size());
  for (const auto& [location, bucket] : shard.buckets) out.push_back(bucket.get());
  return out;
}

core::Cluster InMemoryClusterStore::create_cluster(Bucket& bucket, const core::ClusterKey& key,
                                                   const core::FeatureVector& vector,
                                                   std::uint64_t complaint_id,
                                                   core::Timestamp at) {
  core::Cluster c;
  c.id = next_id_.fetch_add(1);
  c.category = key.category;
  c.location_token = key.location_token;
  c.centroid = vector;
  c.member_count = 1;
  c.first_seen = at;
  c.last_seen = at;
  c.representative_complaint_id = complaint_id;
  c.active = true;
  bucket.clusters.push_back(c);
  return c;
}

void InMemoryClusterStore::join(core::Cluster& cluster, const core::FeatureVector& vector,
                                float alpha, core::Timestamp at) {
  ++cluster.member_count;
  cluster.last_seen = std::max(cluster.last_seen, at);
  blend_centroid(cluster.centroid, vector, alpha);
}

std::expected<ClusterMatch, core::TriageError> InMemoryClusterStore::match_or_create(
    const core::ClusterKey& key,
    const core::FeatureVector& vector,
    const MatchPolicy& policy,
    std::uint64_t complaint_id,
    core::Timestamp at,
    std::chrono::milliseconds lock_timeout) {
  Shard& shard = shards_[core::index_of(key.category)];
  if (policy.location_agnostic) {
    return match_any_location(shard, key, vector, policy, complaint_id, at, lock_timeout);
  }
  return match_keyed(shard, key, vector, policy, complaint_id, at, lock_timeout);
}

std::expected<ClusterMatch, core::TriageError> InMemoryClusterStore::match_keyed(
    Shard& shard, const core::ClusterKey& key, const core::FeatureVector& vector,
    const MatchPolicy& policy, std::uint64_t complaint_id, core::Timestamp at,
    std::chrono::milliseconds lock_timeout) {
  const auto deadline = SteadyClock::now() + lock_timeout;
  std::shared_lock shard_lock(shard.mutex, std::defer_lock);
  if (!shard_lock.try_lock_for(left(deadline))) {
    return std::unexpected(core::TriageError::Timeout);
  }
  Bucket& bucket = bucket_for(shard, key.location_token);
  std::unique_lock bucket_lock(bucket.mutex, std::defer_lock);
  if (!bucket_lock.try_lock_for(left(deadline))) {
    return std::unexpected(core::TriageError::Timeout);
  }

  Nearest best;
  consider(bucket.clusters, vector, best);
  if (best.cluster && best.distance < policy.match_distance) {
    join(*best.cluster, vector, policy.centroid_alpha, at);
    return ClusterMatch{*best.cluster, false, best.distance};
  }
  return ClusterMatch{create_cluster(bucket, key, vector, complaint_id, at), true, 1.f};
}

std::expected<ClusterMatch, core::TriageError> InMemoryClusterStore::match_any_location(
    Shard& shard, const core::ClusterKey& key, const core::FeatureVector& vector,
    const MatchPolicy& policy, std::uint64_t complaint_id, core::Timestamp at,
    std::chrono::milliseconds lock_timeout) {
  const auto deadline = SteadyClock::now() + lock_timeout;
  std::unique_lock shard_lock(shard.mutex, std::defer_lock);
  if (!shard_lock.try_lock_for(left(deadline))) {
    return std::unexpected(core::TriageError::Timeout);
  }
  Bucket& own = bucket_for(shard, key.location_token);

  const std::vector<Bucket*> buckets = buckets_of(shard);
  std::vector<std::unique_lock<std::timed_mutex>> held;
  held.reserve(buckets.size());
  for (Bucket* b : buckets) {
    std::unique_lock lock(b->mutex, std::defer_lock);
    if (!lock.try_lock_for(left(deadline))) {
      return std::unexpected(core::TriageError::Timeout);
    }
    held.push_back(std::move(lock));
  }

  Nearest best;
  for (Bucket* b : buckets) consider(b->clusters, vector, best);
  if (best.cluster && best.distance < policy.match_distance) {
    join(*best.cluster, vector, policy.centroid_alpha, at);
    return ClusterMatch{*best.cluster, false, best.distance};
  }
  return ClusterMatch{create_cluster(own, key, vector, complaint_id, at), true, 1.f};
}

std::expected<SweepReport, core::TriageError> InMemoryClusterStore::sweep(
    core::Timestamp now,
    core::SystemClock::duration inactivity_window,
    std::chrono::milliseconds lock_timeout) {
  SweepReport report;
  for (Shard& shard : shards_) {
    const std::vector<Bucket*> buckets = buckets_of(shard);
    std::shared_lock shard_lock(shard.mutex, std::defer_lock);
    if (!shard_lock.try_lock_for(lock_timeout)) {
      report.deferred += buckets.size();
      continue;
    }
    for (Bucket* b : buckets) {
      std::unique_lock lock(b->mutex, std::defer_lock);
      if (!lock.try_lock_for(lock_timeout)) {
        ++report.deferred;
        continue;
      }
      for (auto& c : b->clusters) {
        if (!c.active) continue;
        ++report.examined;
        if (now - c.last_seen > inactivity_window) {
          c.active = false;
          ++report.deactivated;
        }
      }
    }
  }
  return report;
}

std::vector<core::Cluster> InMemoryClusterStore::history() const {
  std::vector<core::Cluster> out;
  for (const Shard& shard : shards_) {
    std::shared_lock shard_lock(shard.mutex);
    for (Bucket* b : buckets_of(shard)) {
      std::lock_guard lock(b->mutex);
      out.insert(out.end(), b->clusters.begin(), b->clusters.end());
    }
  }
  std::sort(out.begin(), out.end(),
            [](const core::Cluster& a, const core::Cluster& b) { return a.id < b.id; });
  return out;
}

std::optional<core::Cluster> InMemoryClusterStore::find(std::uint64_t id) const {
  for (const Shard& shard : shards_) {
    std::shared_lock shard_lock(shard.mutex);
    for (Bucket* b : buckets_of(shard)) {
      std::lock_guard lock(b->mutex);
      for (const auto& c : b->clusters) {
        if (c.id == id) return c;
      }
    }
  }
  return std::nullopt;
}

std::size_t InMemoryClusterStore::size() const {
  return static_cast<std::size_t>(next_id_.load() - 1);
}

std::unique_lock<std::timed_mutex> InMemoryClusterStore::lock_bucket(const core::ClusterKey& key) {
  Bucket& bucket = bucket_for(shards_[core::index_of(key.category)], key.location_token);
  return std::unique_lock<std::timed_mutex>(bucket.mutex);
}

}  // namespace railtriage::dedup
