#pragma once

#include <railtriage/core/task_executor.hpp>
#include <railtriage/media/ocr_engine.hpp>
#include <chrono>
#include <memory>

namespace railtriage::media {

/// Decorator that runs the wrapped engine on a TaskExecutor and gives up after
/// `timeout`, returning TriageError::Timeout. The abandoned call finishes in the
/// background and its text is dropped.
class TimeBoundedOcrEngine : public IOcrEngine {
 public:
  TimeBoundedOcrEngine(std::shared_ptr<IOcrEngine> inner,
                       std::shared_ptr<core::TaskExecutor> executor,
                       std::chrono::milliseconds timeout);

  [[nodiscard]] std::expected<std::string, core::TriageError> extract_text(
      std::span<const std::byte> image_bytes) override;

  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

 private:
  std::shared_ptr<IOcrEngine> inner_;
  std::shared_ptr<core::TaskExecutor> executor_;
  std::chrono::milliseconds timeout_;
};

}  // namespace railtriage::media
