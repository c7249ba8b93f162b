#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace railtriage::nlp {

/// Normalized location alias -> canonical location token (e.g. "b12" -> "coach-b12").
/// Keys must already be in normalize_location() form; see make_alias_map().
using LocationAliasMap = std::unordered_map<std::string, std::string>;

/// Lowercase, rewrite domain spellings ("a/c" -> "ac", "c.c.t.v" -> "cctv"), replace
/// non-semantic punctuation with spaces (intra-word hyphens kept), collapse whitespace.
/// Bytes >= 0x80 are treated as word characters so non-Latin scripts survive.
[[nodiscard]] std::string normalize_text(std::string_view raw);

/// Split normalized text on spaces.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view normalized);

/// Canonical location token: trim, lowercase, separators -> '-', runs of '-' collapsed,
/// then alias lookup. Absent or blank input yields core::kUnknownLocation.
[[nodiscard]] std::string normalize_location(const std::optional<std::string>& raw,
                                             const LocationAliasMap& aliases = {});

/// Build an alias map from raw (alias, canonical) pairs, normalizing both sides.
[[nodiscard]] LocationAliasMap make_alias_map(
    const std::vector<std::pair<std::string, std::string>>& raw_pairs);

/// True when `phrase` (one or more normalized words) occurs in `normalized` on word boundaries.
[[nodiscard]] bool contains_phrase(std::string_view normalized, std::string_view phrase);

}  // namespace railtriage::nlp
