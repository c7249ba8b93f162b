#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/core/outcome.hpp>
#include <railtriage/dedup/cluster_store.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace railtriage::dedup {

struct DedupOptions {
  float match_distance{0.35f};
  /// Stricter threshold for location-agnostic matching of "unknown" locations.
  float unknown_location_match_distance{0.2f};
  float centroid_alpha{0.3f};
  std::chrono::milliseconds lock_timeout{50};
};

/// Recurrence detection on top of an IClusterStore. Store failures never propagate:
/// they yield a degraded outcome (new cluster, no cluster reference) and a warning.
class Deduplicator {
 public:
  /// \param store May be null; every outcome is then degraded.
  explicit Deduplicator(std::shared_ptr<IClusterStore> store, DedupOptions options = {});

  [[nodiscard]] core::DedupOutcome match_or_create(core::Category category,
                                                   const std::string& location_token,
                                                   const core::FeatureVector& vector,
                                                   std::uint64_t complaint_id,
                                                   core::Timestamp at) const;

  [[nodiscard]] const std::shared_ptr<IClusterStore>& store() const noexcept { return store_; }
  [[nodiscard]] const DedupOptions& options() const noexcept { return options_; }

 private:
  std::shared_ptr<IClusterStore> store_;
  DedupOptions options_;
};

}  // namespace railtriage::dedup
