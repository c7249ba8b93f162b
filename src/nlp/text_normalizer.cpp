#include <railtriage/nlp/text_normalizer.hpp>
#include <railtriage/core/complaint.hpp>
#include <array>
#include <cctype>
#include <utility>

namespace railtriage::nlp {

namespace {

// Spellings of short domain terms that punctuation stripping would otherwise split.
constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kDomainSpellings = {{
    {"c.c.t.v.", "cctv"},
    {"c.c.t.v", "cctv"},
    {"a.c.", "ac"},
    {"a/c", "ac"},
    {"wi-fi", "wifi"},
    {"t.t.e.", "tte"},
}};

bool is_word_char(unsigned char c) {
  return std::isalnum(c) != 0 || c >= 0x80;
}

std::string to_lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
  }
  return out;
}

/// Replace whole-word occurrences of `from` by `to`.
void rewrite_spelling(std::string& s, std::string_view from, std::string_view to) {
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    const std::size_t end = pos + from.size();
    const bool left_ok = pos == 0 || !is_word_char(static_cast<unsigned char>(s[pos - 1]));
    const bool right_ok = end >= s.size() || !is_word_char(static_cast<unsigned char>(s[end]));
    if (left_ok && right_ok) {
      s.replace(pos, from.size(), to);
      pos += to.size();
    } else {
      pos += 1;
    }
  }
}

std::string collapse(std::string_view s, char sep) {
  std::string out;
  out.reserve(s.size());
  bool pending = false;
  for (char c : s) {
    if (c == sep) {
      pending = !out.empty();
      continue;
    }
    if (pending) {
      out.push_back(sep);
      pending = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string location_key(std::string_view raw) {
  const std::string lowered = to_lower(trim(raw));
  std::string mapped;
  mapped.reserve(lowered.size());
  for (unsigned char c : lowered) {
    if (is_word_char(c)) {
      mapped.push_back(static_cast<char>(c));
    } else if (c == ' ' || c == '\t' || c == '_' || c == '.' || c == '/' || c == '-' ||
               c == ',' || c == '\\' || c == ':') {
      mapped.push_back('-');
    }
  }
  return collapse(mapped, '-');
}

}  // namespace

std::string normalize_text(std::string_view raw) {
  std::string s = to_lower(raw);
  for (const auto& [from, to] : kDomainSpellings) {
    rewrite_spelling(s, from, to);
  }

  std::string out;
  out.reserve(s.size());
  const std::size_t n = s.size();
  for (std::size_t i = 0; i < n; ++i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (is_word_char(c)) {
      out.push_back(static_cast<char>(c));
      continue;
    }
    const bool inner = i > 0 && i + 1 < n &&
                       is_word_char(static_cast<unsigned char>(s[i - 1])) &&
                       is_word_char(static_cast<unsigned char>(s[i + 1]));
    if (inner && c == '-') {
      out.push_back('-');
    } else if (inner && c == '\'') {
      // "don't" -> "dont"
    } else {
      out.push_back(' ');
    }
  }
  return collapse(out, ' ');
}

std::vector<std::string> tokenize(std::string_view normalized) {
  std::vector<std::string> tokens;
  std::size_t pos = 0;
  while (pos < normalized.size()) {
    const auto next = normalized.find(' ', pos);
    const auto len = (next == std::string_view::npos ? normalized.size() : next) - pos;
    if (len > 0) tokens.emplace_back(normalized.substr(pos, len));
    if (next == std::string_view::npos) break;
    pos = next + 1;
  }
  return tokens;
}

std::string normalize_location(const std::optional<std::string>& raw,
                               const LocationAliasMap& aliases) {
  if (!raw.has_value()) return core::kUnknownLocation;
  std::string key = location_key(*raw);
  if (key.empty()) return core::kUnknownLocation;
  if (auto it = aliases.find(key); it != aliases.end()) {
    return it->second;
  }
  return key;
}

LocationAliasMap make_alias_map(
    const std::vector<std::pair<std::string, std::string>>& raw_pairs) {
  LocationAliasMap map;
  for (const auto& [alias, canonical] : raw_pairs) {
    std::string from = location_key(alias);
    std::string to = location_key(canonical);
    if (from.empty() || to.empty()) continue;
    map[std::move(from)] = std::move(to);
  }
  return map;
}

bool contains_phrase(std::string_view normalized, std::string_view phrase) {
  if (phrase.empty() || normalized.size() < phrase.size()) return false;
  std::size_t pos = 0;
  while ((pos = normalized.find(phrase, pos)) != std::string_view::npos) {
    const std::size_t end = pos + phrase.size();
    const bool left_ok = pos == 0 || normalized[pos - 1] == ' ';
    const bool right_ok = end == normalized.size() || normalized[end] == ' ';
    if (left_ok && right_ok) return true;
    pos += 1;
  }
  return false;
}

}  // namespace railtriage::nlp
