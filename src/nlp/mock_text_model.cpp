#include <railtriage/nlp/mock_text_model.hpp>
#include <thread>

namespace railtriage::nlp {

MockTextModel::MockTextModel() {
  dist_.fill(1.f / static_cast<float>(core::kCategoryCount));
}

void MockTextModel::set_distribution(CategoryDistribution dist) {
  std::lock_guard lock(mutex_);
  dist_ = dist;
}

void MockTextModel::set_prediction(core::Category category, float confidence) {
  CategoryDistribution dist{};
  const float rest = (1.f - confidence) / static_cast<float>(core::kCategoryCount - 1);
  dist.fill(rest);
  dist[core::index_of(category)] = confidence;
  set_distribution(dist);
}

void MockTextModel::set_latency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

std::expected<CategoryDistribution, core::TriageError>
MockTextModel::predict(std::string_view /*normalized_text*/) {
  calls_.fetch_add(1);
  std::chrono::milliseconds latency;
  CategoryDistribution dist;
  {
    std::lock_guard lock(mutex_);
    latency = latency_;
    dist = dist_;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
  if (!available_.load()) {
    return std::unexpected(core::TriageError::ModelUnavailable);
  }
  return dist;
}

}  // namespace railtriage::nlp
