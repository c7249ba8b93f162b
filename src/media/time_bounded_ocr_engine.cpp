#include <railtriage/media/time_bounded_ocr_engine.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace railtriage::media {

TimeBoundedOcrEngine::TimeBoundedOcrEngine(std::shared_ptr<IOcrEngine> inner,
                                           std::shared_ptr<core::TaskExecutor> executor,
                                           std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), executor_(std::move(executor)), timeout_(timeout) {
  if (!inner_ || !executor_) {
    throw std::invalid_argument("TimeBoundedOcrEngine: inner engine and executor are required");
  }
}

std::string TimeBoundedOcrEngine::name() const {
  return inner_->name();
}

std::expected<std::string, core::TriageError> TimeBoundedOcrEngine::extract_text(
    std::span<const std::byte> image_bytes) {
  // The task may outlive this call, so it owns a copy of the bytes.
  auto bytes = std::make_shared<std::vector<std::byte>>(image_bytes.begin(), image_bytes.end());
  auto inner = inner_;
  auto job = executor_->submit_abandonable([inner, bytes]() {
    return inner->extract_text(std::span<const std::byte>(bytes->data(), bytes->size()));
  });

  if (job.future.wait_for(timeout_) != std::future_status::ready) {
    job.abandon();
    spdlog::warn("OCR ({}) exceeded {} ms; continuing without OCR text", inner_->name(),
                 timeout_.count());
    return std::unexpected(core::TriageError::Timeout);
  }
  return job.future.get();
}

}  // namespace railtriage::media
