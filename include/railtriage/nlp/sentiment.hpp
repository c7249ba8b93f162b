#pragma once

#include <railtriage/core/complaint.hpp>
#include <string>
#include <vector>

namespace railtriage::nlp {

/// Lexicon count over normalized tokens: more negative than positive hits -> Negative, and
/// vice versa; ties -> Neutral. "not working" counts as negative.
[[nodiscard]] core::Sentiment analyze_sentiment(const std::vector<std::string>& tokens);

}  // namespace railtriage::nlp
