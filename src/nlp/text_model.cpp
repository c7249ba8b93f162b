#include <railtriage/nlp/text_model.hpp>

namespace railtriage::nlp {

core::Category top_category(const CategoryDistribution& dist) noexcept {
  std::size_t best = 0;
  for (std::size_t i = 1; i < dist.size(); ++i) {
    if (dist[i] > dist[best]) best = i;
  }
  return core::kAllCategories[best];
}

}  // namespace railtriage::nlp
