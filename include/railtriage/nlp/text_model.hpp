#pragma once

#include <railtriage/core/category.hpp>
#include <railtriage/core/error.hpp>
#include <array>
#include <expected>
#include <string>
#include <string_view>

namespace railtriage::nlp {

/// Probability mass per category, indexed by core::index_of(Category). Sums to 1.
using CategoryDistribution = std::array<float, core::kCategoryCount>;

/// Abstract text model: normalized text -> distribution over categories.
/// Implement predict(); optionally override warmup.
/// predict() may be called from several worker threads concurrently.
class ITextModel {
 public:
  virtual ~ITextModel() = default;

  /// Fails with ModelUnavailable when the model cannot produce a prediction.
  [[nodiscard]] virtual std::expected<CategoryDistribution, core::TriageError>
  predict(std::string_view normalized_text) = 0;

  /// Identifier recorded in decision provenance (e.g. "keyword-v1", "onnx:model.onnx").
  [[nodiscard]] virtual std::string name() const = 0;

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

/// Index of the highest probability; ties resolve to the lowest category ordinal.
[[nodiscard]] core::Category top_category(const CategoryDistribution& dist) noexcept;

}  // namespace railtriage::nlp
