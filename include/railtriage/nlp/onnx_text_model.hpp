#pragma once

#include <railtriage/core/error.hpp>
#include <railtriage/nlp/text_model.hpp>
#include <railtriage/nlp/text_vectorizer.hpp>
#include <memory>
#include <string>

namespace railtriage::nlp {

/// ONNX Runtime text classifier: loads an ONNX model and implements ITextModel.
///
/// Expected model: one float input of shape [1, D] (or [-1, D]) where D equals the
/// vectorizer's dims, fed with TextVectorizer features of the normalized text; one
/// output of shape [1, 5] (or [5]) with one score per category in core::Category order.
/// Scores that are not already a probability distribution (negative values, or a sum
/// away from 1) are passed through softmax.
///
/// Input/output names are configurable via constructor; if empty, the first input/output
/// is used. The constructor throws Ort::Exception when the file cannot be loaded and
/// std::runtime_error when the model shape does not match.
class OnnxTextModel : public ITextModel {
 public:
  OnnxTextModel(std::string model_path,
                TextVectorizer vectorizer,
                std::string input_name = {},
                std::string output_name = {});

  ~OnnxTextModel() override;

  OnnxTextModel(const OnnxTextModel&) = delete;
  OnnxTextModel& operator=(const OnnxTextModel&) = delete;

  [[nodiscard]] std::expected<CategoryDistribution, core::TriageError>
  predict(std::string_view normalized_text) override;

  [[nodiscard]] std::string name() const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace railtriage::nlp
