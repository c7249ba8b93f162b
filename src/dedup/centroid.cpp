#include <railtriage/dedup/centroid.hpp>
#include <algorithm>
#include <cmath>

namespace railtriage::dedup {

float cosine_distance(const core::FeatureVector& a, const core::FeatureVector& b) noexcept {
  if (a.size() != b.size() || a.empty()) return 1.f;
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na <= 0.0 || nb <= 0.0) return 1.f;
  const double sim = dot / (std::sqrt(na) * std::sqrt(nb));
  return std::clamp(static_cast<float>(1.0 - sim), 0.f, 2.f);
}

void blend_centroid(core::FeatureVector& centroid, const core::FeatureVector& sample, float alpha) {
  if (centroid.size() != sample.size()) {
    centroid = sample;
    return;
  }
  alpha = std::clamp(alpha, 0.f, 1.f);
  double norm = 0.0;
  for (std::size_t i = 0; i < centroid.size(); ++i) {
    centroid[i] = (1.f - alpha) * centroid[i] + alpha * sample[i];
    norm += static_cast<double>(centroid[i]) * centroid[i];
  }
  if (norm <= 0.0) return;
  const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
  for (auto& v : centroid) v *= inv;
}

}  // namespace railtriage::dedup
