#pragma once

#include <atomic>
#include <memory>

namespace railtriage::core {

/// Caller-owned cancellation flag. Copies share the same flag, so the caller can keep
/// one copy (e.g. in a disconnect handler) and hand another to triage().
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() noexcept { flag_->store(true, std::memory_order_release); }

  [[nodiscard]] bool cancelled() const noexcept {
    return flag_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace railtriage::core
