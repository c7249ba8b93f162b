#pragma once

#include <railtriage/core/complaint.hpp>

namespace railtriage::dedup {

/// 1 - cosine similarity, clamped to [0, 2]. A zero vector (or a size mismatch) is at
/// distance 1 from everything, so content-free complaints never match on content.
[[nodiscard]] float cosine_distance(const core::FeatureVector& a,
                                    const core::FeatureVector& b) noexcept;

/// Exponential moving average of the centroid towards `sample`, re-normalized to unit length.
/// An empty centroid is replaced by the sample.
void blend_centroid(core::FeatureVector& centroid, const core::FeatureVector& sample, float alpha);

}  // namespace railtriage::dedup
