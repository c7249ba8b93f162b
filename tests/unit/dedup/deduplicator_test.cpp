#include <railtriage/dedup/deduplicator.hpp>
#include <railtriage/dedup/in_memory_cluster_store.hpp>
#include <gtest/gtest.h>
#include <memory>

namespace rd = railtriage::dedup;
namespace rc = railtriage::core;
using namespace std::chrono_literals;

namespace {

const rc::Timestamp kT0 = rc::Timestamp{} + std::chrono::hours(1000);

rc::FeatureVector vec(float x, float y) { return rc::FeatureVector{x, y, 0.f, 0.f}; }

/// Store that always fails, as an unreachable backing store would.
class UnavailableStore : public rd::IClusterStore {
 public:
  std::expected<rd::ClusterMatch, rc::TriageError> match_or_create(
      const rc::ClusterKey&, const rc::FeatureVector&, const rd::MatchPolicy&, std::uint64_t,
      rc::Timestamp, std::chrono::milliseconds) override {
    return std::unexpected(rc::TriageError::Timeout);
  }
  std::expected<rd::SweepReport, rc::TriageError> sweep(rc::Timestamp, rc::SystemClock::duration,
                                                        std::chrono::milliseconds) override {
    return std::unexpected(rc::TriageError::StorageUnavailable);
  }
  std::vector<rc::Cluster> history() const override { return {}; }
  std::optional<rc::Cluster> find(std::uint64_t) const override { return std::nullopt; }
};

/// Records the policy it was called with and delegates to an in-memory store.
class RecordingStore : public rd::InMemoryClusterStore {
 public:
  std::expected<rd::ClusterMatch, rc::TriageError> match_or_create(
      const rc::ClusterKey& key, const rc::FeatureVector& v, const rd::MatchPolicy& policy,
      std::uint64_t id, rc::Timestamp at, std::chrono::milliseconds timeout) override {
    last_policy = policy;
    last_timeout = timeout;
    return rd::InMemoryClusterStore::match_or_create(key, v, policy, id, at, timeout);
  }
  rd::MatchPolicy last_policy;
  std::chrono::milliseconds last_timeout{0};
};

}  // namespace

TEST(Deduplicator, RepeatComplaintIsDuplicate) {
  rd::Deduplicator dedup(std::make_shared<rd::InMemoryClusterStore>());
  auto first = dedup.match_or_create(rc::Category::Maintenance, "coach-b12", vec(1, 0), 1, kT0);
  auto second =
      dedup.match_or_create(rc::Category::Maintenance, "coach-b12", vec(1, 0.05f), 2, kT0 + 1h);
  EXPECT_TRUE(first.is_new_cluster);
  EXPECT_FALSE(first.degraded);
  ASSERT_TRUE(second.cluster.has_value());
  EXPECT_FALSE(second.is_new_cluster);
  EXPECT_EQ(second.cluster->id, first.cluster->id);
  EXPECT_EQ(second.cluster->member_count, 2u);
  EXPECT_LT(second.distance, 0.35f);
}

TEST(Deduplicator, KnownLocationUsesConfiguredThreshold) {
  auto store = std::make_shared<RecordingStore>();
  rd::DedupOptions opts;
  opts.match_distance = 0.4f;
  opts.centroid_alpha = 0.5f;
  opts.lock_timeout = 30ms;
  rd::Deduplicator dedup(store, opts);
  (void)dedup.match_or_create(rc::Category::Staff, "platform-1", vec(1, 0), 1, kT0);
  EXPECT_FALSE(store->last_policy.location_agnostic);
  EXPECT_FLOAT_EQ(store->last_policy.match_distance, 0.4f);
  EXPECT_FLOAT_EQ(store->last_policy.centroid_alpha, 0.5f);
  EXPECT_EQ(store->last_timeout, 30ms);
}

TEST(Deduplicator, UnknownLocationMatchesAnywhereWithStricterThreshold) {
  auto store = std::make_shared<RecordingStore>();
  rd::Deduplicator dedup(store);
  auto seeded = dedup.match_or_create(rc::Category::Cleanliness, "coach-s3", vec(1, 0), 1, kT0);
  auto unknown =
      dedup.match_or_create(rc::Category::Cleanliness, rc::kUnknownLocation, vec(1, 0), 2, kT0);
  EXPECT_TRUE(store->last_policy.location_agnostic);
  EXPECT_FLOAT_EQ(store->last_policy.match_distance, 0.2f);
  ASSERT_TRUE(unknown.cluster.has_value());
  EXPECT_FALSE(unknown.is_new_cluster);
  EXPECT_EQ(unknown.cluster->id, seeded.cluster->id);
}

TEST(Deduplicator, UnknownLocationNeedsCloserMatch) {
  rd::Deduplicator dedup(std::make_shared<rd::InMemoryClusterStore>());
  (void)dedup.match_or_create(rc::Category::Cleanliness, "coach-s3", vec(1, 0), 1, kT0);
  // cos distance ~0.29: inside 0.35, outside 0.2.
  auto far = dedup.match_or_create(rc::Category::Cleanliness, rc::kUnknownLocation,
                                   vec(1, 1), 2, kT0);
  EXPECT_TRUE(far.is_new_cluster);
  auto keyed = dedup.match_or_create(rc::Category::Cleanliness, "coach-s3", vec(1, 1), 3, kT0);
  EXPECT_FALSE(keyed.is_new_cluster);
}

TEST(Deduplicator, StoreFailureDegradesToNewCluster) {
  rd::Deduplicator dedup(std::make_shared<UnavailableStore>());
  auto out = dedup.match_or_create(rc::Category::Security, "platform-2", vec(1, 0), 1, kT0);
  EXPECT_TRUE(out.degraded);
  EXPECT_TRUE(out.is_new_cluster);
  EXPECT_FALSE(out.cluster.has_value());
}

TEST(Deduplicator, MissingStoreDegrades) {
  rd::Deduplicator dedup(nullptr);
  auto out = dedup.match_or_create(rc::Category::Security, "platform-2", vec(1, 0), 1, kT0);
  EXPECT_TRUE(out.degraded);
  EXPECT_TRUE(out.is_new_cluster);
}
