#pragma once

#include <railtriage/core/cancellation.hpp>
#include <railtriage/core/complaint.hpp>
#include <railtriage/core/decision_sink.hpp>
#include <railtriage/core/error.hpp>
#include <railtriage/core/pipeline.hpp>
#include <railtriage/core/task_executor.hpp>
#include <railtriage/dedup/deduplicator.hpp>
#include <railtriage/media/feature_extractor.hpp>
#include <railtriage/nlp/classifier.hpp>
#include <railtriage/routing/router.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>

namespace railtriage::app {

/// Collaborators of one engine. extractor, classifier and router are required;
/// deduplicator, executor and sink are optional.
struct TriageComponents {
  std::shared_ptr<media::FeatureExtractor> extractor;
  std::shared_ptr<nlp::Classifier> classifier;
  std::shared_ptr<dedup::Deduplicator> deduplicator;
  std::shared_ptr<routing::Router> router;
  /// Worker pool for classification. Without it classification runs inline and the
  /// classifier timeout is not enforced.
  std::shared_ptr<core::TaskExecutor> executor;
  std::shared_ptr<core::IDecisionSink> sink;
};

struct TriageOptions {
  std::chrono::milliseconds latency_budget{2000};
  std::chrono::milliseconds classifier_timeout{500};
  /// Use Other/default urgency when the model is unavailable instead of failing.
  bool classifier_fallback{true};
};

/// Runs Extract -> Classify -> Dedup -> Route -> Publish for one complaint and returns
/// the decision. Fatal errors (UnknownCategory, StorageUnavailable, Cancelled,
/// ModelUnavailable without fallback) come back as std::unexpected; every other
/// problem degrades and is recorded in the decision's quality flags.
/// Thread-safe: triage() may be called concurrently; complaints are independent apart
/// from the cluster store.
class TriageOrchestrator {
 public:
  using ClockFn = std::function<core::Timestamp()>;

  /// \throws std::invalid_argument if a required component is missing.
  TriageOrchestrator(TriageComponents components,
                     TriageOptions options = {},
                     ClockFn clock = [] { return core::SystemClock::now(); });

  /// \param latency_budget nullopt = options().latency_budget.
  /// \param cancel Honoured before each stage up to Routed.
  /// \param timing_cb Called per stage with (state, duration_ms).
  [[nodiscard]] std::expected<core::ComplaintDecision, core::TriageError> triage(
      const core::ComplaintInput& input,
      std::optional<std::chrono::milliseconds> latency_budget = std::nullopt,
      const core::CancellationToken* cancel = nullptr,
      core::StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const TriageComponents& components() const noexcept { return components_; }
  [[nodiscard]] const TriageOptions& options() const noexcept { return options_; }

 private:
  TriageComponents components_;
  TriageOptions options_;
  ClockFn clock_;
  core::Pipeline pipeline_;
  mutable std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace railtriage::app
