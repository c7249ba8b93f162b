#pragma once

#include <railtriage/core/complaint.hpp>
#include <railtriage/core/error.hpp>
#include <railtriage/nlp/text_model.hpp>
#include <railtriage/nlp/urgency_scorer.hpp>
#include <expected>
#include <memory>
#include <string>

namespace railtriage::nlp {

struct ClassifierOptions {
  /// Top-1 probability below this routes to Other.
  float confidence_threshold{0.4f};
  /// Urgency used for content-free complaints.
  float default_urgency{0.5f};
};

/// FeatureBundle -> ClassificationResult: category from the text model plus the
/// confidence rule, urgency from the UrgencyScorer (never from the model).
/// Thread-safe as long as the model's predict() is.
class Classifier {
 public:
  Classifier(std::shared_ptr<ITextModel> model,
             UrgencyScorer scorer,
             ClassifierOptions options = {});

  /// Fails with ModelUnavailable when no model is configured or the model fails.
  [[nodiscard]] std::expected<core::ClassificationResult, core::TriageError> classify(
      const core::FeatureBundle& bundle) const;

  /// Model identifier for provenance ("none" without a model).
  [[nodiscard]] std::string model_name() const;

  [[nodiscard]] const ClassifierOptions& options() const noexcept { return options_; }
  [[nodiscard]] const UrgencyScorer& scorer() const noexcept { return scorer_; }

 private:
  std::shared_ptr<ITextModel> model_;
  UrgencyScorer scorer_;
  ClassifierOptions options_;
};

}  // namespace railtriage::nlp
