#pragma once

#include <railtriage/core/complaint.hpp>
#include <railtriage/media/ocr_engine.hpp>
#include <railtriage/nlp/text_normalizer.hpp>
#include <railtriage/nlp/text_vectorizer.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace railtriage::media {

struct FeatureExtractorOptions {
  nlp::LocationAliasMap location_aliases;
  /// Attachments larger than this are not decoded (degraded).
  std::size_t max_media_bytes{10u * 1024u * 1024u};
};

/// Stand-in tokens for a complaint with no usable text: a hash of the image bytes and
/// of the video reference, or a fixed token when there is no media either. Identical
/// attachments give identical embeddings, so a repeated photo-only report deduplicates.
[[nodiscard]] std::vector<std::string> content_fingerprint(const core::ComplaintInput& input);

/// ComplaintInput -> FeatureBundle. Text normalization, OCR of the image and of the first
/// video frame, location canonicalization, tokens, hashed embedding and sentiment.
/// Media problems never fail extraction: they set the degraded flags and a note.
/// Thread-safety: const methods are safe to call concurrently if the OCR engine is.
class FeatureExtractor {
 public:
  /// \param ocr May be null (OCR disabled): media is noted but not read.
  FeatureExtractor(std::shared_ptr<IOcrEngine> ocr,
                   nlp::TextVectorizer vectorizer,
                   FeatureExtractorOptions options = {});

  [[nodiscard]] core::FeatureBundle extract(const core::ComplaintInput& input) const;

  [[nodiscard]] const nlp::TextVectorizer& vectorizer() const noexcept { return vectorizer_; }
  [[nodiscard]] bool has_ocr() const noexcept { return ocr_ != nullptr; }

 private:
  /// OCR one encoded image; appends normalized text to `ocr_parts` or degrades `bundle`.
  void read_image(std::span<const std::byte> bytes, const char* source,
                  core::FeatureBundle& bundle, std::string& ocr_parts) const;

  std::shared_ptr<IOcrEngine> ocr_;
  nlp::TextVectorizer vectorizer_;
  FeatureExtractorOptions options_;
};

}  // namespace railtriage::media
