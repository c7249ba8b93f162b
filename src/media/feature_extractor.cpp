#include <railtriage/media/feature_extractor.hpp>
#include <railtriage/media/video_frame.hpp>
#include <railtriage/nlp/sentiment.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <string_view>

namespace railtriage::media {

namespace {

std::string hex_digest(std::string_view prefix, std::uint64_t h) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(prefix);
  out += ':';
  for (int shift = 60; shift >= 0; shift -= 4) out += kHex[(h >> shift) & 0xF];
  return out;
}

}  // namespace

std::vector<std::string> content_fingerprint(const core::ComplaintInput& input) {
  std::vector<std::string> tokens;
  if (!input.image_bytes.empty()) {
    const std::string_view raw(reinterpret_cast<const char*>(input.image_bytes.data()),
                               input.image_bytes.size());
    tokens.push_back(hex_digest("image", nlp::TextVectorizer::fnv1a(raw)));
  }
  if (input.video_ref.has_value() && !input.video_ref->empty()) {
    tokens.push_back(hex_digest("video", nlp::TextVectorizer::fnv1a(*input.video_ref)));
  }
  if (tokens.empty()) tokens.emplace_back("<empty>");
  return tokens;
}

FeatureExtractor::FeatureExtractor(std::shared_ptr<IOcrEngine> ocr,
                                   nlp::TextVectorizer vectorizer,
                                   FeatureExtractorOptions options)
    : ocr_(std::move(ocr)), vectorizer_(std::move(vectorizer)), options_(std::move(options)) {}

void FeatureExtractor::read_image(std::span<const std::byte> bytes, const char* source,
                                  core::FeatureBundle& bundle, std::string& ocr_parts) const {
  if (bytes.size() > options_.max_media_bytes) {
    bundle.media_degraded = true;
    bundle.notes.push_back(std::string(source) + " exceeds max_media_bytes; not decoded");
    spdlog::warn("{} of {} bytes exceeds limit {}; skipping OCR", source, bytes.size(),
                 options_.max_media_bytes);
    return;
  }
  if (!ocr_) return;

  auto text = ocr_->extract_text(bytes);
  if (!text) {
    if (text.error() == core::TriageError::MediaDecodeFailed) {
      bundle.media_degraded = true;
    } else {
      bundle.ocr_degraded = true;
    }
    bundle.notes.push_back(std::string(source) + " OCR failed: " +
                           std::string(core::to_string(text.error())));
    spdlog::warn("{} OCR via {} failed ({}); continuing without it", source, ocr_->name(),
                 core::to_string(text.error()));
    return;
  }
  const std::string normalized = nlp::normalize_text(*text);
  if (normalized.empty()) return;
  if (!ocr_parts.empty()) ocr_parts += ' ';
  ocr_parts += normalized;
}

core::FeatureBundle FeatureExtractor::extract(const core::ComplaintInput& input) const {
  core::FeatureBundle bundle;
  bundle.normalized_text = nlp::normalize_text(input.text);
  bundle.location_token = nlp::normalize_location(input.reporter_location, options_.location_aliases);
  bundle.submitted_at = input.submitted_at;
  bundle.observed_at = input.submitted_at;

  const bool has_image = !input.image_bytes.empty();
  const bool has_video = input.video_ref.has_value() && !input.video_ref->empty();
  bundle.has_media = has_image || has_video;

  std::string ocr_parts;
  if (has_image) {
    read_image(input.image_bytes, "image", bundle, ocr_parts);
  }
  if (has_video) {
    if (auto frame = first_frame_png(*input.video_ref)) {
      read_image(*frame, "video frame", bundle, ocr_parts);
    } else {
      bundle.media_degraded = true;
      bundle.notes.push_back("video could not be opened or has no frame");
      spdlog::warn("video '{}' could not be decoded; continuing without it", *input.video_ref);
    }
  }
  if (bundle.has_media && ocr_) {
    bundle.ocr_text = std::move(ocr_parts);
  }

  bundle.tokens = nlp::tokenize(bundle.normalized_text);
  if (bundle.ocr_text.has_value() && !bundle.ocr_text->empty()) {
    auto ocr_tokens = nlp::tokenize(*bundle.ocr_text);
    bundle.tokens.insert(bundle.tokens.end(), ocr_tokens.begin(), ocr_tokens.end());
  }
  if (!bundle.tokens.empty()) {
    bundle.embedding = vectorizer_.vectorize(bundle.tokens);
  } else {
    bundle.embedding = vectorizer_.vectorize(content_fingerprint(input));
  }
  bundle.sentiment = nlp::analyze_sentiment(bundle.tokens);
  return bundle;
}

}  // namespace railtriage::media
