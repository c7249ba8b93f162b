#include <railtriage/media/mock_ocr_engine.hpp>
#include <thread>

namespace railtriage::media {

void MockOcrEngine::set_text(std::string text) {
  std::lock_guard lock(mutex_);
  text_ = std::move(text);
}

void MockOcrEngine::set_error(std::optional<core::TriageError> error) {
  std::lock_guard lock(mutex_);
  error_ = error;
}

void MockOcrEngine::set_latency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

std::expected<std::string, core::TriageError> MockOcrEngine::extract_text(
    std::span<const std::byte> image_bytes) {
  calls_.fetch_add(1);
  std::string text;
  std::optional<core::TriageError> error;
  std::chrono::milliseconds latency;
  {
    std::lock_guard lock(mutex_);
    text = text_;
    error = error_;
    latency = latency_;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
  if (error.has_value()) {
    return std::unexpected(*error);
  }
  if (image_bytes.empty()) {
    return std::unexpected(core::TriageError::MediaDecodeFailed);
  }
  return text;
}

}  // namespace railtriage::media
