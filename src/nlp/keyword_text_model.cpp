#include <railtriage/nlp/keyword_text_model.hpp>
#include <railtriage/nlp/text_normalizer.hpp>
#include <stdexcept>

namespace railtriage::nlp {

namespace c = railtriage::core;

KeywordTable default_keyword_table() {
  KeywordTable t;
  t[c::index_of(c::Category::Cleanliness)] = {
      "dirty",   "filthy",  "garbage",    "trash",    "unclean",  "messy",
      "stinking", "cockroach", "cockroaches", "rats",  "dustbin",  "littered",
      "unhygienic", "not cleaned", "overflowing", "stains",
  };
  t[c::index_of(c::Category::Maintenance)] = {
      "broken",  "damaged", "cracked", "torn",   "ripped", "not working",
      "leaking", "leak",    "repair",  "fan",    "light",  "ac",
      "socket",  "charging", "bulb",   "jammed", "faulty", "malfunctioning",
  };
  t[c::index_of(c::Category::Safety)] = {
      "fire",     "smoke",  "sparks",   "burning", "theft",  "stolen",
      "harassment", "fight", "accident", "danger", "unsafe", "hazard",
      "emergency", "medical", "security", "weapon", "derailment", "injured",
  };
  t[c::index_of(c::Category::Staff)] = {
      "rude",      "unhelpful", "impolite", "arrogant", "staff",  "behavior",
      "behaviour", "attitude",  "bribe",    "tte",      "ignoring", "misbehaved",
  };
  // Other has no vocabulary of its own; it only collects smoothing mass.
  return t;
}

KeywordTextModel::KeywordTextModel(KeywordTable table, float smoothing)
    : table_(std::move(table)), smoothing_(smoothing) {
  if (smoothing_ <= 0.f) {
    throw std::invalid_argument("KeywordTextModel: smoothing must be > 0");
  }
}

std::expected<CategoryDistribution, core::TriageError>
KeywordTextModel::predict(std::string_view normalized_text) {
  std::array<float, c::kCategoryCount> hits{};
  float total = 0.f;
  for (std::size_t i = 0; i < c::kCategoryCount; ++i) {
    for (const auto& kw : table_[i]) {
      if (contains_phrase(normalized_text, kw)) {
        hits[i] += 1.f;
      }
    }
    total += hits[i];
  }

  CategoryDistribution dist{};
  const float denom = total + static_cast<float>(c::kCategoryCount) * smoothing_;
  for (std::size_t i = 0; i < c::kCategoryCount; ++i) {
    dist[i] = (hits[i] + smoothing_) / denom;
  }
  return dist;
}

}  // namespace railtriage::nlp
