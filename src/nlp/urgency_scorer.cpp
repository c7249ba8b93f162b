#include <railtriage/nlp/urgency_scorer.hpp>
#include <railtriage/nlp/text_normalizer.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace railtriage::nlp {

namespace {

bool any_term(const std::string& text, const std::vector<std::string>& terms) {
  return std::any_of(terms.begin(), terms.end(),
                     [&text](const std::string& t) { return contains_phrase(text, t); });
}

}  // namespace

const std::vector<std::string>& UrgencyScorer::hazard_terms() {
  static const std::vector<std::string> terms = {
      "fire",      "smoke",   "sparks",    "burning",  "gas leak",   "explosion",
      "accident",  "derail",  "derailment", "injury",  "injured",    "bleeding",
      "medical",   "unconscious", "theft", "stolen",   "harassment", "fight",
      "danger",    "unsafe",  "hazard",    "emergency", "weapon",    "short circuit",
  };
  return terms;
}

const std::vector<std::string>& UrgencyScorer::severity_terms() {
  static const std::vector<std::string> terms = {
      "urgent", "immediate", "immediately", "asap",   "critical",
      "broken", "not working", "leaking",   "stuck",  "overflowing",
  };
  return terms;
}

UrgencyScorer::UrgencyScorer(UrgencyWeights weights) : weights_(weights) {}

core::UrgencyFactors UrgencyScorer::factors(const core::FeatureBundle& bundle) const {
  std::string text = bundle.normalized_text;
  if (bundle.ocr_text.has_value() && !bundle.ocr_text->empty()) {
    text += ' ';
    text += *bundle.ocr_text;
  }

  core::UrgencyFactors f;
  const auto age = bundle.observed_at - bundle.submitted_at;
  if (age <= core::SystemClock::duration::zero() || weights_.recency_decay_hours <= 0.f) {
    f.recency = 1.f;
  } else {
    const double age_h = std::chrono::duration<double, std::ratio<3600>>(age).count();
    f.recency = static_cast<float>(std::exp(-age_h / weights_.recency_decay_hours));
  }
  f.hazard = any_term(text, hazard_terms()) ? 1.f : 0.f;
  f.severity = any_term(text, severity_terms()) ? 1.f : 0.f;
  f.media = bundle.has_media ? 1.f : 0.f;
  return f;
}

float UrgencyScorer::score(const core::UrgencyFactors& f) const noexcept {
  const float raw = weights_.recency * f.recency + weights_.hazard * f.hazard +
                    weights_.severity * f.severity + weights_.media * f.media;
  return std::clamp(raw, 0.f, 1.f);
}

float UrgencyScorer::score(const core::FeatureBundle& bundle) const {
  return score(factors(bundle));
}

}  // namespace railtriage::nlp
