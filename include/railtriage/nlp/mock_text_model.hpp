#pragma once

#include <railtriage/nlp/text_model.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>

namespace railtriage::nlp {

/// Mock model that returns a configurable distribution (for tests/demo).
/// Latency and availability can be scripted to exercise timeouts and fallbacks.
class MockTextModel : public ITextModel {
 public:
  MockTextModel();

  /// Distribution to return on subsequent predict() calls.
  void set_distribution(CategoryDistribution dist);
  /// Put all mass on one category except `1 - confidence`, spread evenly over the rest.
  void set_prediction(core::Category category, float confidence);
  void set_latency(std::chrono::milliseconds latency);
  void set_available(bool available) noexcept { available_ = available; }

  [[nodiscard]] std::expected<CategoryDistribution, core::TriageError>
  predict(std::string_view normalized_text) override;

  [[nodiscard]] std::string name() const override { return "mock"; }

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  mutable std::mutex mutex_;
  CategoryDistribution dist_{};
  std::chrono::milliseconds latency_{0};
  std::atomic<bool> available_{true};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace railtriage::nlp
