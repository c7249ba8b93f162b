#include <railtriage/nlp/sentiment.hpp>
#include <array>
#include <string_view>

namespace railtriage::nlp {

namespace {

constexpr std::array<std::string_view, 11> kNegative = {
    "bad", "poor", "terrible", "awful", "horrible", "broken",
    "dirty", "worst", "disgusting", "pathetic", "smells",
};

constexpr std::array<std::string_view, 8> kPositive = {
    "good", "great", "excellent", "clean", "working", "nice", "thank", "thanks",
};

template <std::size_t N>
bool in(const std::array<std::string_view, N>& words, std::string_view w) {
  for (auto x : words) {
    if (x == w) return true;
  }
  return false;
}

}  // namespace

core::Sentiment analyze_sentiment(const std::vector<std::string>& tokens) {
  int negative = 0;
  int positive = 0;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const std::string& t = tokens[i];
    if (t == "not" && i + 1 < tokens.size() && tokens[i + 1] == "working") {
      ++negative;
      ++i;
      continue;
    }
    if (in(kNegative, t)) ++negative;
    else if (in(kPositive, t)) ++positive;
  }
  if (negative > positive) return core::Sentiment::Negative;
  if (positive > negative) return core::Sentiment::Positive;
  return core::Sentiment::Neutral;
}

}  // namespace railtriage::nlp
