#pragma once

#include <railtriage/media/ocr_engine.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace railtriage::media {

/// OCR via Tesseract (LSTM engine). Images are decoded and preprocessed with OpenCV
/// (grayscale, 640x480) before recognition. Output is lowercased and trimmed.
/// Thread-safety: one TessBaseAPI instance guarded by a mutex; wrap in
/// TimeBoundedOcrEngine to bound latency.
class TesseractOcrEngine : public IOcrEngine {
 public:
  /// \param language Tesseract language code(s), e.g. "eng" or "eng+hin".
  /// \param tessdata_path Directory containing traineddata; empty uses the library default.
  /// \throws std::runtime_error if Tesseract cannot be initialized.
  explicit TesseractOcrEngine(std::string language = "eng", std::string tessdata_path = {});
  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine&) = delete;
  TesseractOcrEngine& operator=(const TesseractOcrEngine&) = delete;

  [[nodiscard]] std::expected<std::string, core::TriageError> extract_text(
      std::span<const std::byte> image_bytes) override;

  [[nodiscard]] std::string name() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::mutex mutex_;
};

}  // namespace railtriage::media
