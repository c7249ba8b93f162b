#include <railtriage/nlp/text_normalizer.hpp>
#include <railtriage/nlp/urgency_scorer.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>

namespace nl = railtriage::nlp;
namespace rc = railtriage::core;
using namespace std::chrono_literals;

namespace {

rc::FeatureBundle bundle(const char* text, rc::Timestamp submitted, rc::Timestamp observed) {
  rc::FeatureBundle b;
  b.normalized_text = nl::normalize_text(text);
  b.tokens = nl::tokenize(b.normalized_text);
  b.submitted_at = submitted;
  b.observed_at = observed;
  return b;
}

const rc::Timestamp kT0 = rc::Timestamp{} + std::chrono::hours(24 * 365 * 50);

}  // namespace

TEST(UrgencyScorer, FreshSeverityComplaint) {
  nl::UrgencyScorer scorer;
  const auto f = scorer.factors(bundle("Seat broken, smells bad", kT0, kT0));
  EXPECT_FLOAT_EQ(f.recency, 1.f);
  EXPECT_FLOAT_EQ(f.hazard, 0.f);
  EXPECT_FLOAT_EQ(f.severity, 1.f);
  EXPECT_FLOAT_EQ(f.media, 0.f);
  EXPECT_NEAR(scorer.score(f), 0.40f, 1e-6f);
}

TEST(UrgencyScorer, HazardReachesTopTier) {
  nl::UrgencyScorer scorer;
  EXPECT_NEAR(scorer.score(bundle("Fire smell in pantry car", kT0, kT0)), 0.85f, 1e-6f);
}

TEST(UrgencyScorer, SafetyKeywordNeverLowersUrgency) {
  nl::UrgencyScorer scorer;
  for (const char* text : {"", "fan broken", "toilet dirty", "seat torn, urgent"}) {
    const auto base = bundle(text, kT0, kT0 + 3h);
    auto with_smoke = base;
    with_smoke.normalized_text += " smoke";
    EXPECT_GT(scorer.score(with_smoke), scorer.score(base)) << text;
  }
}

TEST(UrgencyScorer, RecencyDecaysExponentially) {
  nl::UrgencyScorer scorer;
  const auto f = scorer.factors(bundle("delay", kT0, kT0 + 24h));
  EXPECT_NEAR(f.recency, std::exp(-1.f), 1e-5f);
  EXPECT_NEAR(scorer.score(f), 0.30f * std::exp(-1.f), 1e-5f);
}

TEST(UrgencyScorer, FutureTimestampCountsAsFresh) {
  nl::UrgencyScorer scorer;
  EXPECT_FLOAT_EQ(scorer.factors(bundle("x", kT0 + 1h, kT0)).recency, 1.f);
}

TEST(UrgencyScorer, MediaAndOcrTextContribute) {
  nl::UrgencyScorer scorer;
  auto b = bundle("see photo", kT0, kT0);
  b.has_media = true;
  b.ocr_text = "smoke near door";
  const auto f = scorer.factors(b);
  EXPECT_FLOAT_EQ(f.media, 1.f);
  EXPECT_FLOAT_EQ(f.hazard, 1.f);
  EXPECT_FLOAT_EQ(scorer.score(f), 1.f);  // 0.30 + 0.55 + 0.15
}

TEST(UrgencyScorer, ScoreIsClamped) {
  nl::UrgencyWeights w;
  w.recency = 1.f;
  w.hazard = 1.f;
  nl::UrgencyScorer scorer(w);
  EXPECT_FLOAT_EQ(scorer.score(bundle("fire", kT0, kT0)), 1.f);
}
