#include <railtriage/nlp/text_vectorizer.hpp>
#include <cmath>
#include <stdexcept>

namespace railtriage::nlp {

TextVectorizer::TextVectorizer(std::size_t dims, float bigram_weight)
    : dims_(dims), bigram_weight_(bigram_weight) {
  if (dims_ == 0) {
    throw std::invalid_argument("TextVectorizer: dims must be > 0");
  }
}

std::uint64_t TextVectorizer::fnv1a(std::string_view s) noexcept {
  std::uint64_t h = 14695981039346656037ull;
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return h;
}

core::FeatureVector TextVectorizer::vectorize(const std::vector<std::string>& tokens) const {
  core::FeatureVector v(dims_, 0.f);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    v[fnv1a(tokens[i]) % dims_] += 1.f;
    if (i + 1 < tokens.size() && bigram_weight_ > 0.f) {
      const std::string bigram = tokens[i] + ' ' + tokens[i + 1];
      v[fnv1a(bigram) % dims_] += bigram_weight_;
    }
  }

  float norm_sq = 0.f;
  for (float x : v) norm_sq += x * x;
  if (norm_sq > 0.f) {
    const float inv = 1.f / std::sqrt(norm_sq);
    for (float& x : v) x *= inv;
  }
  return v;
}

}  // namespace railtriage::nlp
