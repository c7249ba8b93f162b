#include <railtriage/app/config.hpp>
#include <railtriage/core/category.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace railtriage::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

[[noreturn]] void bad_value(const std::string& key, const std::string& value) {
  throw std::invalid_argument("config: invalid value '" + value + "' for key '" + key + "'");
}

float to_float(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const float v = std::stof(value, &used);
    if (used != value.size()) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

unsigned long to_unsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value[0] == '-') bad_value(key, value);
  try {
    std::size_t used = 0;
    const unsigned long v = std::stoul(value, &used);
    if (used != value.size()) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

bool to_bool(const std::string& key, const std::string& value) {
  const std::string v = lower(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  bad_value(key, value);
}

/// "department.<category>" / "sla_hours.<category>" suffix -> category, or nullopt (warned).
std::optional<core::Category> category_suffix(const std::string& key, std::size_t prefix_len) {
  auto c = core::parse_category(std::string_view(key).substr(prefix_len));
  if (!c) spdlog::warn("config: ignoring '{}' (unknown category)", key);
  return c;
}

}  // namespace

std::vector<routing::UrgencyTier> parse_urgency_tiers(const std::string& value) {
  std::vector<routing::UrgencyTier> tiers;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto comma = value.find(',', start);
    std::string item = value.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
    trim(item);
    if (!item.empty()) {
      const auto colon = item.find(':');
      if (colon == std::string::npos) bad_value("urgency_tiers", value);
      std::string min = item.substr(0, colon);
      std::string mult = item.substr(colon + 1);
      trim(min);
      trim(mult);
      tiers.push_back({to_float("urgency_tiers", min), to_float("urgency_tiers", mult)});
    }
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  if (tiers.empty()) bad_value("urgency_tiers", value);
  return tiers;
}

TriageConfig default_config() {
  TriageConfig c;
  c.model_backend = ModelBackendType::Keyword;
  c.ocr_backend = OcrBackendType::None;
  c.routing = routing::default_routing_policy();
  return c;
}

TriageConfig load_config(const std::string& path) {
  TriageConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "model_backend") {
      const auto v = lower(value);
      if (v == "keyword") c.model_backend = ModelBackendType::Keyword;
      else if (v == "onnx") c.model_backend = ModelBackendType::Onnx;
      else bad_value(key, value);
    }
    else if (key == "model_path") c.model_path = value;
    else if (key == "ocr_backend") {
      const auto v = lower(value);
      if (v == "none") c.ocr_backend = OcrBackendType::None;
      else if (v == "tesseract") c.ocr_backend = OcrBackendType::Tesseract;
      else if (v == "mock") c.ocr_backend = OcrBackendType::Mock;
      else bad_value(key, value);
    }
    else if (key == "ocr_language") c.ocr_language = value;
    else if (key == "tessdata_path") c.tessdata_path = value;
    else if (key == "vector_dims") c.vector_dims = to_unsigned(key, value);
    else if (key == "confidence_threshold") c.confidence_threshold = to_float(key, value);
    else if (key == "default_urgency") c.default_urgency = to_float(key, value);
    else if (key == "classifier_fallback") c.classifier_fallback = to_bool(key, value);
    else if (key == "urgency.recency_weight") c.urgency_weights.recency = to_float(key, value);
    else if (key == "urgency.hazard_weight") c.urgency_weights.hazard = to_float(key, value);
    else if (key == "urgency.severity_weight") c.urgency_weights.severity = to_float(key, value);
    else if (key == "urgency.media_weight") c.urgency_weights.media = to_float(key, value);
    else if (key == "urgency.recency_decay_hours") c.urgency_weights.recency_decay_hours = to_float(key, value);
    else if (key == "latency_budget_ms") c.latency_budget_ms = static_cast<std::uint32_t>(to_unsigned(key, value));
    else if (key == "classifier_timeout_ms") c.classifier_timeout_ms = static_cast<std::uint32_t>(to_unsigned(key, value));
    else if (key == "ocr_timeout_ms") c.ocr_timeout_ms = static_cast<std::uint32_t>(to_unsigned(key, value));
    else if (key == "store_timeout_ms") c.store_timeout_ms = static_cast<std::uint32_t>(to_unsigned(key, value));
    else if (key == "inference_workers") c.inference_workers = to_unsigned(key, value);
    else if (key == "match_distance") c.match_distance = to_float(key, value);
    else if (key == "unknown_location_match_distance") c.unknown_location_match_distance = to_float(key, value);
    else if (key == "centroid_alpha") c.centroid_alpha = to_float(key, value);
    else if (key == "inactivity_window_hours") c.inactivity_window_hours = to_float(key, value);
    else if (key == "sweep_interval_s") c.sweep_interval_s = static_cast<std::uint32_t>(to_unsigned(key, value));
    else if (key == "repetition_threshold") c.routing.repetition_threshold = static_cast<std::uint32_t>(to_unsigned(key, value));
    else if (key == "urgency_tiers") c.routing.tiers = parse_urgency_tiers(value);
    else if (key == "max_media_bytes") c.max_media_bytes = to_unsigned(key, value);
    else if (key.starts_with("department.")) {
      if (auto cat = category_suffix(key, std::string_view("department.").size())) {
        auto dept = core::parse_department(value);
        if (!dept) bad_value(key, value);
        c.routing.departments[*cat] = *dept;
      }
    }
    else if (key.starts_with("sla_hours.")) {
      if (auto cat = category_suffix(key, std::string_view("sla_hours.").size())) {
        const float hours = to_float(key, value);
        const auto window = std::chrono::minutes(static_cast<std::int64_t>(hours * 60.f + 0.5f));
        // Windows are kept in whole minutes; anything shorter would be due on arrival.
        if (!(hours > 0.f) || window.count() <= 0) bad_value(key, value);
        c.routing.base_windows[*cat] = window;
      }
    }
    else if (key.starts_with("location_alias.")) {
      c.location_aliases.emplace_back(key.substr(std::string_view("location_alias.").size()), value);
    }
  }
  return c;
}

std::expected<void, core::TriageError> validate_config(const TriageConfig& c) {
  auto fail = [](std::string_view what) -> std::expected<void, core::TriageError> {
    spdlog::error("invalid config: {}", what);
    return std::unexpected(core::TriageError::InvalidConfig);
  };
  auto unit = [](float v) { return v >= 0.f && v <= 1.f; };

  if (c.model_backend == ModelBackendType::Onnx && c.model_path.empty()) {
    return fail("model_backend=onnx requires model_path");
  }
  if (c.vector_dims == 0) return fail("vector_dims must be positive");
  if (!unit(c.confidence_threshold)) return fail("confidence_threshold must be in [0,1]");
  if (!unit(c.default_urgency)) return fail("default_urgency must be in [0,1]");
  const auto& w = c.urgency_weights;
  if (w.recency < 0.f || w.hazard < 0.f || w.severity < 0.f || w.media < 0.f) {
    return fail("urgency weights must be non-negative");
  }
  if (w.recency_decay_hours <= 0.f) return fail("urgency.recency_decay_hours must be positive");
  if (c.latency_budget_ms == 0) return fail("latency_budget_ms must be positive");
  if (c.classifier_timeout_ms == 0) return fail("classifier_timeout_ms must be positive");
  if (c.ocr_timeout_ms == 0) return fail("ocr_timeout_ms must be positive");
  if (c.store_timeout_ms == 0) return fail("store_timeout_ms must be positive");
  if (c.inference_workers == 0) return fail("inference_workers must be positive");
  if (c.match_distance <= 0.f || c.match_distance > 2.f) {
    return fail("match_distance must be in (0,2]");
  }
  if (c.unknown_location_match_distance <= 0.f || c.unknown_location_match_distance > 2.f) {
    return fail("unknown_location_match_distance must be in (0,2]");
  }
  if (c.unknown_location_match_distance > c.match_distance) {
    return fail("unknown_location_match_distance must not exceed match_distance");
  }
  if (c.centroid_alpha <= 0.f || c.centroid_alpha > 1.f) return fail("centroid_alpha must be in (0,1]");
  if (c.inactivity_window_hours <= 0.0) return fail("inactivity_window_hours must be positive");
  if (c.sweep_interval_s == 0) return fail("sweep_interval_s must be positive");
  if (c.routing.repetition_threshold == 0) return fail("repetition_threshold must be positive");
  for (const auto& [cat, window] : c.routing.base_windows) {
    if (window.count() <= 0) {
      return fail("sla_hours." + std::string(core::to_string(cat)) + " must be at least one minute");
    }
  }
  if (!routing::normalize_tiers(c.routing.tiers)) {
    return fail("urgency_tiers must be non-empty, in [0,1], with multipliers >= 1 rising with urgency");
  }
  if (c.max_media_bytes == 0) return fail("max_media_bytes must be positive");
  return {};
}

}  // namespace railtriage::app
