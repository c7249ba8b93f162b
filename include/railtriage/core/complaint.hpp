#pragma once

#include <railtriage/core/category.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace railtriage::core {

/// Memory: records own their buffers (std::vector / std::string); move them into the
/// pipeline. Thread-safety: distinct records are independent.

using SystemClock = std::chrono::system_clock;
using Timestamp = SystemClock::time_point;

/// Hashed bag-of-words vector; L2-normalized when non-zero.
using FeatureVector = std::vector<float>;

/// Location sentinel used when the reporter gave no usable location.
inline constexpr const char* kUnknownLocation = "unknown";

enum class Sentiment : std::uint8_t {
  Negative,
  Neutral,
  Positive,
};

/// One complaint as handed over by the intake collaborator. Immutable once built.
struct ComplaintInput {
  std::string text;
  std::vector<std::byte> image_bytes;        // empty = no image
  std::optional<std::string> video_ref;      // opaque handle readable by the video decoder
  Timestamp submitted_at{};
  std::optional<std::string> reporter_location;
  std::optional<std::uint64_t> complaint_id;  // assigned by the orchestrator when absent
};

/// Features derived from one ComplaintInput; owned by the pipeline run that produced it.
struct FeatureBundle {
  std::string normalized_text;
  std::optional<std::string> ocr_text;  // set when media was run through OCR ("" on failure)
  bool has_media{false};
  std::string location_token{kUnknownLocation};
  std::vector<std::string> tokens;      // text + OCR tokens
  FeatureVector embedding;
  Sentiment sentiment{Sentiment::Neutral};
  Timestamp submitted_at{};
  Timestamp observed_at{};              // reference time for recency; set by the orchestrator

  bool ocr_degraded{false};
  bool media_degraded{false};
  std::vector<std::string> notes;

  [[nodiscard]] bool degraded() const noexcept { return ocr_degraded || media_degraded; }

  /// True when there is nothing to classify: no text, no OCR text and no media.
  [[nodiscard]] bool content_free() const noexcept {
    return normalized_text.empty() && (!ocr_text.has_value() || ocr_text->empty()) &&
           !has_media;
  }
};

/// Individual urgency contributions, kept for audit.
struct UrgencyFactors {
  float recency{0.f};
  float hazard{0.f};
  float severity{0.f};
  float media{0.f};
};

struct ClassificationResult {
  Category category{Category::Other};
  float confidence{0.f};
  float urgency{0.f};
  Category model_category{Category::Other};  // raw top-1 before the confidence rule
  bool below_threshold{false};
  UrgencyFactors urgency_factors{};
};

/// Degradations encountered while producing a decision.
struct QualityFlags {
  bool ocr_degraded{false};
  bool media_degraded{false};
  bool classifier_fallback{false};
  bool dedup_degraded{false};
  std::vector<std::string> notes;

  [[nodiscard]] bool degraded() const noexcept {
    return ocr_degraded || media_degraded || classifier_fallback || dedup_degraded;
  }
};

/// Output of the engine; ownership passes to the caller.
struct ComplaintDecision {
  std::uint64_t complaint_id{0};
  Category category{Category::Other};
  float urgency{0.f};
  Department department{Department::GeneralAdministration};
  Timestamp sla_deadline{};
  std::optional<std::uint64_t> duplicate_of;  // cluster id when a recurrence was detected
  bool is_new_cluster{true};

  // Provenance for the analytics collaborator.
  std::optional<std::uint64_t> cluster_id;
  std::uint32_t cluster_member_count{0};
  float confidence{0.f};
  Category model_category{Category::Other};
  std::string model_name;
  bool urgency_escalated{false};
  UrgencyFactors urgency_factors{};
  Sentiment sentiment{Sentiment::Neutral};
  std::string location_token{kUnknownLocation};
  Timestamp submitted_at{};
  QualityFlags quality;
  double processing_ms{0.0};
};

[[nodiscard]] const char* to_string(Sentiment s) noexcept;

}  // namespace railtriage::core
