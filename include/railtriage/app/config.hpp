#pragma once

#include <railtriage/core/error.hpp>
#include <railtriage/nlp/urgency_scorer.hpp>
#include <railtriage/routing/router.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace railtriage::app {

/// Text model backend: keyword (rule-based) or onnx (learned model over hashed features).
enum class ModelBackendType {
  Keyword,
  Onnx,
};

/// OCR backend: none (media is noted but not read), tesseract, or mock (demo/tests).
enum class OcrBackendType {
  None,
  Tesseract,
  Mock,
};

/// Engine configuration: backends, thresholds, budgets, routing policy.
struct TriageConfig {
  ModelBackendType model_backend{ModelBackendType::Keyword};
  std::string model_path;
  OcrBackendType ocr_backend{OcrBackendType::None};
  std::string ocr_language{"eng"};
  std::string tessdata_path;

  std::size_t vector_dims{256};
  float confidence_threshold{0.4f};
  float default_urgency{0.5f};
  bool classifier_fallback{true};
  nlp::UrgencyWeights urgency_weights{};

  std::uint32_t latency_budget_ms{2000};
  std::uint32_t classifier_timeout_ms{500};
  std::uint32_t ocr_timeout_ms{1000};
  std::uint32_t store_timeout_ms{50};
  std::size_t inference_workers{2};

  float match_distance{0.35f};
  float unknown_location_match_distance{0.2f};
  float centroid_alpha{0.3f};
  double inactivity_window_hours{72.0};
  std::uint32_t sweep_interval_s{60};

  routing::RoutingPolicy routing{routing::default_routing_policy()};

  /// Raw (alias, canonical) location pairs; normalized when the engine is built.
  std::vector<std::pair<std::string, std::string>> location_aliases;
  std::size_t max_media_bytes{10u * 1024u * 1024u};
};

/// Load config from a simple key=value file (one per line, '#' comments) or use defaults
/// when the file does not exist. Unknown keys are ignored.
/// \throws std::invalid_argument on a malformed value.
TriageConfig load_config(const std::string& path);

/// Default config when no file is provided.
TriageConfig default_config();

/// Range checks and tier monotonicity. InvalidConfig on the first violation (logged).
[[nodiscard]] std::expected<void, core::TriageError> validate_config(const TriageConfig& config);

/// Parse "min:multiplier,min:multiplier,...". \throws std::invalid_argument when malformed.
[[nodiscard]] std::vector<routing::UrgencyTier> parse_urgency_tiers(const std::string& value);

}  // namespace railtriage::app
