#include <railtriage/app/config.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ra = railtriage::app;
namespace rc = railtriage::core;

namespace {

/// Writes `content` to a per-test file under the temp directory and removes it afterwards.
class ConfigFile {
 public:
  explicit ConfigFile(const std::string& content) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = std::filesystem::temp_directory_path() /
            (std::string("railtriage_") + info->name() + ".conf");
    std::ofstream(path_) << content;
  }
  ~ConfigFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  [[nodiscard]] std::string path() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

}  // namespace

TEST(Config, MissingFileGivesDefaults) {
  const auto c = ra::load_config("/nonexistent/railtriage.conf");
  EXPECT_EQ(c.model_backend, ra::ModelBackendType::Keyword);
  EXPECT_EQ(c.ocr_backend, ra::OcrBackendType::None);
  EXPECT_FLOAT_EQ(c.confidence_threshold, 0.4f);
  EXPECT_EQ(c.latency_budget_ms, 2000u);
  EXPECT_EQ(c.routing.tiers.size(), 3u);
  EXPECT_TRUE(ra::validate_config(c).has_value());
}

TEST(Config, ParsesKeysCommentsAndWhitespace) {
  ConfigFile f(
      "# engine\n"
      "model_backend = onnx\n"
      "model_path=/models/triage.onnx\n"
      "ocr_backend = Mock\n"
      "\n"
      "confidence_threshold = 0.55\n"
      "classifier_fallback = off\n"
      "urgency.hazard_weight = 0.6\n"
      "latency_budget_ms = 1500\n"
      "inference_workers = 4\n"
      "match_distance = 0.3\n"
      "inactivity_window_hours = 24\n"
      "repetition_threshold = 3\n"
      "urgency_tiers = 0:1, 0.9:6, 0.6:3\n"
      "some_future_key = whatever\n");
  const auto c = ra::load_config(f.path());
  EXPECT_EQ(c.model_backend, ra::ModelBackendType::Onnx);
  EXPECT_EQ(c.model_path, "/models/triage.onnx");
  EXPECT_EQ(c.ocr_backend, ra::OcrBackendType::Mock);
  EXPECT_FLOAT_EQ(c.confidence_threshold, 0.55f);
  EXPECT_FALSE(c.classifier_fallback);
  EXPECT_FLOAT_EQ(c.urgency_weights.hazard, 0.6f);
  EXPECT_EQ(c.latency_budget_ms, 1500u);
  EXPECT_EQ(c.inference_workers, 4u);
  EXPECT_FLOAT_EQ(c.match_distance, 0.3f);
  EXPECT_DOUBLE_EQ(c.inactivity_window_hours, 24.0);
  EXPECT_EQ(c.routing.repetition_threshold, 3u);
  ASSERT_EQ(c.routing.tiers.size(), 3u);
  EXPECT_TRUE(ra::validate_config(c).has_value());
}

TEST(Config, RoutingOverridesAndAliases) {
  ConfigFile f(
      "department.staff = GeneralAdministration\n"
      "sla_hours.cleanliness = 1.5\n"
      "department.catering = Housekeeping\n"
      "location_alias.B12 = coach-b12\n");
  const auto c = ra::load_config(f.path());
  EXPECT_EQ(c.routing.departments.at(rc::Category::Staff), rc::Department::GeneralAdministration);
  EXPECT_EQ(c.routing.base_windows.at(rc::Category::Cleanliness), std::chrono::minutes(90));
  EXPECT_EQ(c.routing.departments.size(), 5u);
  ASSERT_EQ(c.location_aliases.size(), 1u);
  EXPECT_EQ(c.location_aliases[0].first, "B12");
  EXPECT_EQ(c.location_aliases[0].second, "coach-b12");
}

TEST(Config, MalformedValuesThrow) {
  {
    ConfigFile f("confidence_threshold = high\n");
    EXPECT_THROW(ra::load_config(f.path()), std::invalid_argument);
  }
  {
    ConfigFile f("inference_workers = -2\n");
    EXPECT_THROW(ra::load_config(f.path()), std::invalid_argument);
  }
  {
    ConfigFile f("model_backend = tensorflow\n");
    EXPECT_THROW(ra::load_config(f.path()), std::invalid_argument);
  }
  {
    ConfigFile f("department.safety = Police\n");
    EXPECT_THROW(ra::load_config(f.path()), std::invalid_argument);
  }
  {
    ConfigFile f("urgency_tiers = 0.5-2\n");
    EXPECT_THROW(ra::load_config(f.path()), std::invalid_argument);
  }
  {
    // 0.005 h is 18 s, which rounds to a zero-minute window.
    ConfigFile f("sla_hours.safety = 0.005\n");
    EXPECT_THROW(ra::load_config(f.path()), std::invalid_argument);
  }
  {
    ConfigFile f("sla_hours.safety = 0.0084\n");
    const auto c = ra::load_config(f.path());
    EXPECT_EQ(c.routing.base_windows.at(rc::Category::Safety), std::chrono::minutes(1));
  }
}

TEST(Config, ValidateRejectsOutOfRange) {
  auto c = ra::default_config();
  c.confidence_threshold = 1.5f;
  auto r = ra::validate_config(c);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), rc::TriageError::InvalidConfig);

  c = ra::default_config();
  c.model_backend = ra::ModelBackendType::Onnx;
  EXPECT_FALSE(ra::validate_config(c).has_value());

  c = ra::default_config();
  c.inference_workers = 0;
  EXPECT_FALSE(ra::validate_config(c).has_value());

  c = ra::default_config();
  c.routing.tiers = {{0.8f, 2.f}, {0.5f, 4.f}, {0.f, 1.f}};
  EXPECT_FALSE(ra::validate_config(c).has_value());

  c = ra::default_config();
  c.match_distance = 0.3f;
  c.unknown_location_match_distance = 0.3f;
  EXPECT_TRUE(ra::validate_config(c).has_value());
  c.unknown_location_match_distance = 0.5f;
  EXPECT_FALSE(ra::validate_config(c).has_value());

  c = ra::default_config();
  c.routing.base_windows[rc::Category::Cleanliness] = std::chrono::minutes(0);
  EXPECT_FALSE(ra::validate_config(c).has_value());
}

TEST(Config, ParseUrgencyTiers) {
  const auto tiers = ra::parse_urgency_tiers("0.8:4, 0.5:2,0:1");
  ASSERT_EQ(tiers.size(), 3u);
  EXPECT_FLOAT_EQ(tiers[0].min_urgency, 0.8f);
  EXPECT_FLOAT_EQ(tiers[0].multiplier, 4.f);
  EXPECT_FLOAT_EQ(tiers[2].min_urgency, 0.f);
  EXPECT_THROW((void)ra::parse_urgency_tiers(""), std::invalid_argument);
}
