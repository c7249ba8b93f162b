// End-to-end triage through build_engine(): keyword model, in-memory cluster store,
// default routing policy.
#include <railtriage/analytics/decision_log.hpp>
#include <railtriage/analytics/trend_report.hpp>
#include <railtriage/app/config.hpp>
#include <railtriage/app/engine_builder.hpp>
#include <railtriage/media/mock_ocr_engine.hpp>
#include <railtriage/nlp/chat_intake.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace ra = railtriage::app;
namespace rc = railtriage::core;
namespace rm = railtriage::media;
namespace nl = railtriage::nlp;
namespace an = railtriage::analytics;
using namespace std::chrono_literals;

namespace {

rc::ComplaintInput complaint(const char* text, const char* location) {
  rc::ComplaintInput in;
  in.text = text;
  if (location) in.reporter_location = location;
  in.submitted_at = rc::SystemClock::now();
  return in;
}

class TriageScenarios : public ::testing::Test {
 protected:
  void SetUp() override {
    log_ = std::make_shared<an::DecisionLog>();
    engine_ = ra::build_engine(ra::default_config(), log_);
  }

  [[nodiscard]] const ra::TriageOrchestrator& orchestrator() const { return *engine_.orchestrator; }

  std::shared_ptr<an::DecisionLog> log_;
  ra::TriageEngine engine_;
};

}  // namespace

TEST_F(TriageScenarios, BrokenSeatGoesToMaintenance) {
  const auto in = complaint("Seat broken, smells bad", "Coach-B12");
  auto d = orchestrator().triage(in);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->category, rc::Category::Maintenance);
  EXPECT_EQ(d->department, rc::Department::Maintenance);
  EXPECT_GE(d->urgency, 0.3f);
  EXPECT_TRUE(d->is_new_cluster);
  EXPECT_FALSE(d->duplicate_of.has_value());
  EXPECT_EQ(d->location_token, "coach-b12");
  EXPECT_EQ(d->sla_deadline, in.submitted_at + 12h);
  EXPECT_EQ(d->model_name, "keyword-v1");
  EXPECT_EQ(d->sentiment, rc::Sentiment::Negative);
}

TEST_F(TriageScenarios, RepeatedComplaintIsDuplicateAndEscalated) {
  auto first = orchestrator().triage(complaint("Seat broken, smells bad", "Coach-B12"));
  const auto again = complaint("Seat broken, smells bad", "Coach-B12");
  auto second = orchestrator().triage(again);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(second->is_new_cluster);
  ASSERT_TRUE(second->duplicate_of.has_value());
  EXPECT_EQ(*second->duplicate_of, *first->cluster_id);
  EXPECT_EQ(second->cluster_member_count, 2u);
  EXPECT_TRUE(second->urgency_escalated);
  EXPECT_GT(second->urgency, first->urgency);
  EXPECT_EQ(second->sla_deadline, again.submitted_at + 6h);
}

TEST_F(TriageScenarios, FireIsTopTierSafety) {
  const auto in = complaint("Fire smell in pantry car", "pantry car");
  auto d = orchestrator().triage(in);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->category, rc::Category::Safety);
  EXPECT_EQ(d->department, rc::Department::Safety);
  EXPECT_GE(d->urgency, 0.8f);
  EXPECT_EQ(d->sla_deadline, in.submitted_at + 30min);
  EXPECT_FLOAT_EQ(d->urgency_factors.hazard, 1.f);
}

TEST_F(TriageScenarios, EmptyComplaintIsOtherWithDefaultUrgency) {
  auto d = orchestrator().triage(complaint("", nullptr));
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->category, rc::Category::Other);
  EXPECT_FLOAT_EQ(d->urgency, 0.5f);
  EXPECT_EQ(d->department, rc::Department::GeneralAdministration);
  EXPECT_EQ(d->location_token, "unknown");
}

TEST_F(TriageScenarios, DifferentLocationsDoNotMerge) {
  auto a = orchestrator().triage(complaint("AC not working", "coach-b1"));
  auto b = orchestrator().triage(complaint("AC not working", "coach-b2"));
  ASSERT_TRUE(a.has_value() && b.has_value());
  EXPECT_TRUE(b->is_new_cluster);
  EXPECT_NE(*a->cluster_id, *b->cluster_id);
}

TEST_F(TriageScenarios, AnalyticsSeeDecisionStream) {
  ASSERT_TRUE(orchestrator().triage(complaint("Seat broken", "coach-b12")).has_value());
  ASSERT_TRUE(orchestrator().triage(complaint("Seat broken", "coach-b12")).has_value());
  ASSERT_TRUE(orchestrator().triage(complaint("Seat broken", "coach-b12")).has_value());
  ASSERT_TRUE(orchestrator().triage(complaint("Toilet dirty", "coach-b12")).has_value());

  const auto decisions = log_->snapshot();
  ASSERT_EQ(decisions.size(), 4u);
  const auto trends = an::category_trends(decisions);
  ASSERT_FALSE(trends.empty());
  EXPECT_EQ(trends[0].category, rc::Category::Maintenance);
  EXPECT_EQ(trends[0].count, 3u);
  EXPECT_EQ(an::performance_summary(decisions).duplicates, 2u);

  const auto recurring = an::predict_recurring_issues(engine_.store->history());
  ASSERT_EQ(recurring.size(), 1u);
  EXPECT_EQ(recurring[0].member_count, 3u);
  EXPECT_EQ(recurring[0].location_token, "coach-b12");
}

TEST_F(TriageScenarios, AgingSweepKeepsFreshClusters) {
  ASSERT_TRUE(orchestrator().triage(complaint("fan broken", "coach-s1")).has_value());
  auto report = engine_.aging->run_once();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->examined, 1u);
  EXPECT_EQ(report->deactivated, 0u);
}

TEST_F(TriageScenarios, ChatMessageBecomesComplaint) {
  nl::ChatIntake chat;
  auto in = chat.to_complaint("Smoke coming from coach S3 of train 12951!", rc::SystemClock::now());
  ASSERT_TRUE(in.has_value());
  auto d = orchestrator().triage(*in);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->department, rc::Department::Safety);
  EXPECT_EQ(d->location_token, "train-12951-coach-s3");
}

TEST(TriageScenariosOcr, OcrTimeoutDegradesButDecides) {
  auto slow = std::make_shared<rm::MockOcrEngine>();
  slow->set_text("fire");
  slow->set_latency(500ms);
  auto config = ra::default_config();
  config.ocr_timeout_ms = 20;
  auto engine = ra::build_engine(config, nullptr, slow);

  auto in = complaint("see attached photo", "coach-b4");
  in.image_bytes = std::vector<std::byte>(32, std::byte{0x11});
  auto d = engine.orchestrator->triage(in);
  ASSERT_TRUE(d.has_value());
  EXPECT_TRUE(d->quality.ocr_degraded);
  EXPECT_TRUE(d->quality.degraded());
  EXPECT_FALSE(d->quality.notes.empty());
  EXPECT_FLOAT_EQ(d->urgency_factors.media, 1.f);
  EXPECT_FLOAT_EQ(d->urgency_factors.hazard, 0.f);
}

TEST(TriageScenariosOcr, OcrTextFeedsClassificationAndUrgency) {
  auto ocr = std::make_shared<rm::MockOcrEngine>();
  ocr->set_text("SMOKE near the door");
  auto engine = ra::build_engine(ra::default_config(), nullptr, ocr);

  auto in = complaint("please look at this", "coach-b4");
  in.image_bytes = std::vector<std::byte>(32, std::byte{0x11});
  auto d = engine.orchestrator->triage(in);
  ASSERT_TRUE(d.has_value());
  EXPECT_FALSE(d->quality.degraded());
  EXPECT_EQ(d->category, rc::Category::Safety);
  EXPECT_GE(d->urgency, 0.99f);
}

TEST(TriageScenariosConfig, InvalidConfigIsRejected) {
  auto config = ra::default_config();
  config.routing.tiers.clear();
  EXPECT_THROW((void)ra::build_engine(config), std::invalid_argument);
}

TEST(TriageScenariosConfig, UnloadableOnnxModelFallsBack) {
  auto config = ra::default_config();
  config.model_backend = ra::ModelBackendType::Onnx;
  config.model_path = "/nonexistent/railtriage_model.onnx";
  auto engine = ra::build_engine(config);
  auto d = engine.orchestrator->triage(complaint("fan broken", "coach-b4"));
  ASSERT_TRUE(d.has_value());
  EXPECT_TRUE(d->quality.classifier_fallback);
  EXPECT_EQ(d->model_name, "none");
}
