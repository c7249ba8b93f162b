#pragma once

#include <railtriage/core/decision_sink.hpp>
#include <cstddef>
#include <mutex>
#include <vector>

namespace railtriage::analytics {

/// In-process decision stream: an IDecisionSink that keeps every published decision
/// for the analytics functions. Thread-safe. When `capacity` is non-zero the oldest
/// decisions are dropped beyond it.
class DecisionLog : public core::IDecisionSink {
 public:
  explicit DecisionLog(std::size_t capacity = 0) : capacity_(capacity) {}

  [[nodiscard]] std::expected<void, core::TriageError> publish(
      const core::ComplaintDecision& decision) override;

  /// Copy of the log, oldest first.
  [[nodiscard]] std::vector<core::ComplaintDecision> snapshot() const;
  [[nodiscard]] std::size_t size() const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::vector<core::ComplaintDecision> decisions_;
  std::size_t capacity_;
};

}  // namespace railtriage::analytics
