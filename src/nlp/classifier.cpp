#include <railtriage/nlp/classifier.hpp>

namespace railtriage::nlp {

Classifier::Classifier(std::shared_ptr<ITextModel> model,
                       UrgencyScorer scorer,
                       ClassifierOptions options)
    : model_(std::move(model)), scorer_(std::move(scorer)), options_(options) {}

std::string Classifier::model_name() const {
  return model_ ? model_->name() : std::string("none");
}

std::expected<core::ClassificationResult, core::TriageError> Classifier::classify(
    const core::FeatureBundle& bundle) const {
  core::ClassificationResult out;

  if (bundle.content_free()) {
    out.category = core::Category::Other;
    out.model_category = core::Category::Other;
    out.confidence = 0.f;
    out.below_threshold = true;
    out.urgency = options_.default_urgency;
    return out;
  }

  if (!model_) {
    return std::unexpected(core::TriageError::ModelUnavailable);
  }

  std::string text = bundle.normalized_text;
  if (bundle.ocr_text.has_value() && !bundle.ocr_text->empty()) {
    if (!text.empty()) text += ' ';
    text += *bundle.ocr_text;
  }

  auto dist = model_->predict(text);
  if (!dist) {
    return std::unexpected(dist.error());
  }

  out.model_category = top_category(*dist);
  out.confidence = (*dist)[core::index_of(out.model_category)];
  out.below_threshold = out.confidence < options_.confidence_threshold;
  out.category = out.below_threshold ? core::Category::Other : out.model_category;

  out.urgency_factors = scorer_.factors(bundle);
  out.urgency = scorer_.score(out.urgency_factors);
  return out;
}

}  // namespace railtriage::nlp
