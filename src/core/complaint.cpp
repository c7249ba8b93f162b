#include <railtriage/core/complaint.hpp>

namespace railtriage::core {

const char* to_string(Sentiment s) noexcept {
  switch (s) {
    case Sentiment::Negative: return "negative";
    case Sentiment::Neutral: return "neutral";
    case Sentiment::Positive: return "positive";
  }
  return "neutral";
}

}  // namespace railtriage::core
