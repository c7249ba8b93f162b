#pragma once

#include <railtriage/app/triage_orchestrator.hpp>
#include <railtriage/core/pipeline_stage.hpp>

namespace railtriage::app::detail {

/// Input -> FeatureBundle. Never fails on media problems.
class ExtractStage : public core::ITriageStage {
 public:
  explicit ExtractStage(std::shared_ptr<media::FeatureExtractor> extractor);
  [[nodiscard]] core::TriageState target_state() const noexcept override {
    return core::TriageState::Extracted;
  }
  [[nodiscard]] std::expected<void, core::TriageError> process(core::TriageContext& ctx) override;

 private:
  std::shared_ptr<media::FeatureExtractor> extractor_;
};

/// Classification on the worker pool, bounded by min(classifier timeout, remaining budget).
/// Timeout, or an unavailable model with fallback enabled, yields Other/default urgency.
class ClassifyStage : public core::ITriageStage {
 public:
  ClassifyStage(std::shared_ptr<nlp::Classifier> classifier,
                std::shared_ptr<core::TaskExecutor> executor,
                TriageOptions options);
  [[nodiscard]] core::TriageState target_state() const noexcept override {
    return core::TriageState::Classified;
  }
  [[nodiscard]] std::expected<void, core::TriageError> process(core::TriageContext& ctx) override;

 private:
  void fall_back(core::TriageContext& ctx, std::string note) const;

  std::shared_ptr<nlp::Classifier> classifier_;
  std::shared_ptr<core::TaskExecutor> executor_;
  TriageOptions options_;
};

class DedupStage : public core::ITriageStage {
 public:
  explicit DedupStage(std::shared_ptr<dedup::Deduplicator> deduplicator);
  [[nodiscard]] core::TriageState target_state() const noexcept override {
    return core::TriageState::Deduped;
  }
  [[nodiscard]] std::expected<void, core::TriageError> process(core::TriageContext& ctx) override;

 private:
  std::shared_ptr<dedup::Deduplicator> deduplicator_;
};

/// Routing plus assembly of the ComplaintDecision.
class RouteStage : public core::ITriageStage {
 public:
  explicit RouteStage(std::shared_ptr<routing::Router> router);
  [[nodiscard]] core::TriageState target_state() const noexcept override {
    return core::TriageState::Routed;
  }
  [[nodiscard]] std::expected<void, core::TriageError> process(core::TriageContext& ctx) override;

 private:
  std::shared_ptr<routing::Router> router_;
};

/// Stamps processing time and hands the decision to the sink (if any).
class PublishStage : public core::ITriageStage {
 public:
  explicit PublishStage(std::shared_ptr<core::IDecisionSink> sink);
  [[nodiscard]] core::TriageState target_state() const noexcept override {
    return core::TriageState::Decided;
  }
  [[nodiscard]] std::expected<void, core::TriageError> process(core::TriageContext& ctx) override;

 private:
  std::shared_ptr<core::IDecisionSink> sink_;
};

}  // namespace railtriage::app::detail
