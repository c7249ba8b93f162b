#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/core/complaint.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace railtriage::core {

/// Rolling-store key: complaints are only compared within the same key
/// (except location-agnostic matching for the "unknown" sentinel).
struct ClusterKey {
  Category category{Category::Other};
  std::string location_token{kUnknownLocation};

  bool operator==(const ClusterKey&) const = default;
};

struct ClusterKeyHash {
  std::size_t operator()(const ClusterKey& k) const noexcept {
    return std::hash<std::string>{}(k.location_token) * 31u + index_of(k.category);
  }
};

/// A group of complaints judged to describe the same recurring issue.
struct Cluster {
  std::uint64_t id{0};
  Category category{Category::Other};
  std::string location_token{kUnknownLocation};
  FeatureVector centroid;
  std::uint32_t member_count{0};
  Timestamp first_seen{};
  Timestamp last_seen{};
  std::uint64_t representative_complaint_id{0};
  bool active{true};
};

}  // namespace railtriage::core
