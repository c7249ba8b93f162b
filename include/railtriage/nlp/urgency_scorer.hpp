#pragma once

#include <railtriage/core/complaint.hpp>
#include <string>
#include <vector>

namespace railtriage::nlp {

/// Weights of the urgency formula. Each factor is in [0,1]; the weighted sum is clamped.
struct UrgencyWeights {
  float recency{0.30f};
  float hazard{0.55f};
  float severity{0.10f};
  float media{0.15f};
  float recency_decay_hours{24.f};
};

/// Explainable urgency score, independent of the category model:
///   clamp(w_recency * recency + w_hazard * [hazard term] + w_severity * [severity term]
///         + w_media * [has media], 0, 1)
/// recency = exp(-age_hours / decay_hours), 1 when the complaint is not older than the
/// reference time (bundle.observed_at).
class UrgencyScorer {
 public:
  explicit UrgencyScorer(UrgencyWeights weights = {});

  [[nodiscard]] core::UrgencyFactors factors(const core::FeatureBundle& bundle) const;

  [[nodiscard]] float score(const core::FeatureBundle& bundle) const;
  [[nodiscard]] float score(const core::UrgencyFactors& factors) const noexcept;

  [[nodiscard]] const UrgencyWeights& weights() const noexcept { return weights_; }

  /// Safety/hazard vocabulary (normalized words/phrases).
  [[nodiscard]] static const std::vector<std::string>& hazard_terms();
  /// Words signalling an escalated but non-hazardous complaint.
  [[nodiscard]] static const std::vector<std::string>& severity_terms();

 private:
  UrgencyWeights weights_;
};

}  // namespace railtriage::nlp
