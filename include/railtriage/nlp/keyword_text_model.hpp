#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/nlp/text_model.hpp>
#include <array>
#include <string>
#include <vector>

namespace railtriage::nlp {

/// Keywords (single words or multi-word phrases, already normalized) per category.
using KeywordTable = std::array<std::vector<std::string>, core::kCategoryCount>;

/// Built-in railway complaint vocabulary.
[[nodiscard]] KeywordTable default_keyword_table();

/// Rule-based model: counts keyword hits per category and turns the counts into a
/// distribution with additive smoothing, p_c = (hits_c + alpha) / (sum + K * alpha).
/// No hits -> uniform distribution. Stateless after construction; thread-safe.
class KeywordTextModel : public ITextModel {
 public:
  explicit KeywordTextModel(KeywordTable table = default_keyword_table(),
                            float smoothing = 0.1f);

  [[nodiscard]] std::expected<CategoryDistribution, core::TriageError>
  predict(std::string_view normalized_text) override;

  [[nodiscard]] std::string name() const override { return "keyword-v1"; }

 private:
  KeywordTable table_;
  float smoothing_;
};

}  // namespace railtriage::nlp
