#include <railtriage/media/tesseract_ocr_engine.hpp>
#include "cv_image_utils.hpp"
#include <tesseract/baseapi.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace railtriage::media {

namespace {

std::string clean_ocr_output(const char* raw) {
  std::string text(raw ? raw : "");
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  const auto first = text.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n\f\v");
  return text.substr(first, last - first + 1);
}

}  // namespace

struct TesseractOcrEngine::Impl {
  tesseract::TessBaseAPI api;
  std::string language;
};

TesseractOcrEngine::TesseractOcrEngine(std::string language, std::string tessdata_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->language = std::move(language);
  const char* datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
  if (impl_->api.Init(datapath, impl_->language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
    throw std::runtime_error("Tesseract init failed for language '" + impl_->language + "'");
  }
  impl_->api.SetVariable("preserve_interword_spaces", "1");
  impl_->api.SetPageSegMode(tesseract::PSM_AUTO);
}

TesseractOcrEngine::~TesseractOcrEngine() {
  if (impl_) impl_->api.End();
}

std::string TesseractOcrEngine::name() const {
  return "tesseract:" + impl_->language;
}

std::expected<std::string, core::TriageError> TesseractOcrEngine::extract_text(
    std::span<const std::byte> image_bytes) {
  auto decoded = detail::decode_image(image_bytes);
  if (!decoded) {
    return std::unexpected(core::TriageError::MediaDecodeFailed);
  }
  cv::Mat gray;
  try {
    gray = detail::preprocess_for_ocr(*decoded);
  } catch (const cv::Exception& e) {
    spdlog::warn("OCR preprocessing failed: {}", e.what());
    return std::unexpected(core::TriageError::MediaDecodeFailed);
  }

  std::lock_guard lock(mutex_);
  impl_->api.SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
  char* out = impl_->api.GetUTF8Text();
  if (out == nullptr) {
    impl_->api.Clear();
    return std::unexpected(core::TriageError::OcrFailed);
  }
  std::string text = clean_ocr_output(out);
  delete[] out;
  impl_->api.Clear();
  return text;
}

}  // namespace railtriage::media
