#include <railtriage/dedup/deduplicator.hpp>
#include <spdlog/spdlog.h>

namespace railtriage::dedup {

Deduplicator::Deduplicator(std::shared_ptr<IClusterStore> store, DedupOptions options)
    : store_(std::move(store)), options_(options) {}

core::DedupOutcome Deduplicator::match_or_create(core::Category category,
                                                 const std::string& location_token,
                                                 const core::FeatureVector& vector,
                                                 std::uint64_t complaint_id,
                                                 core::Timestamp at) const {
  core::DedupOutcome out;
  if (!store_) {
    out.degraded = true;
    return out;
  }

  MatchPolicy policy;
  policy.centroid_alpha = options_.centroid_alpha;
  policy.location_agnostic = location_token == core::kUnknownLocation;
  policy.match_distance = policy.location_agnostic ? options_.unknown_location_match_distance
                                                   : options_.match_distance;

  auto match = store_->match_or_create(core::ClusterKey{category, location_token}, vector, policy,
                                       complaint_id, at, options_.lock_timeout);
  if (!match) {
    spdlog::warn("cluster store unavailable for complaint {} ({}); treating as new",
                 complaint_id, core::to_string(match.error()));
    out.degraded = true;
    return out;
  }
  out.is_new_cluster = match->is_new;
  out.distance = match->distance;
  out.cluster = std::move(match->cluster);
  return out;
}

}  // namespace railtriage::dedup
