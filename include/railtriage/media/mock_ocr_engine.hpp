#pragma once

#include <railtriage/media/ocr_engine.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace railtriage::media {

/// Mock OCR that returns scripted text or a scripted error (for tests/demo).
class MockOcrEngine : public IOcrEngine {
 public:
  void set_text(std::string text);
  /// Fail every subsequent call with `error` (nullopt clears it).
  void set_error(std::optional<core::TriageError> error);
  void set_latency(std::chrono::milliseconds latency);

  [[nodiscard]] std::expected<std::string, core::TriageError> extract_text(
      std::span<const std::byte> image_bytes) override;

  [[nodiscard]] std::string name() const override { return "mock-ocr"; }

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  mutable std::mutex mutex_;
  std::string text_;
  std::optional<core::TriageError> error_;
  std::chrono::milliseconds latency_{0};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace railtriage::media
