#pragma once

#include <railtriage/core/complaint.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace railtriage::nlp {

/// Feature hashing of unigrams and bigrams into a fixed number of buckets.
/// Output is L2-normalized (all zeros for an empty token list).
/// Deterministic across runs and platforms (FNV-1a), so vectors can be persisted
/// and fed to a model trained offline with the same hashing.
class TextVectorizer {
 public:
  explicit TextVectorizer(std::size_t dims = 256, float bigram_weight = 0.5f);

  [[nodiscard]] core::FeatureVector vectorize(const std::vector<std::string>& tokens) const;

  [[nodiscard]] std::size_t dims() const noexcept { return dims_; }

  [[nodiscard]] static std::uint64_t fnv1a(std::string_view s) noexcept;

 private:
  std::size_t dims_;
  float bigram_weight_;
};

}  // namespace railtriage::nlp
