#pragma once

#include <railtriage/core/cancellation.hpp>
#include <railtriage/core/complaint.hpp>
#include <railtriage/core/error.hpp>
#include <railtriage/core/outcome.hpp>
#include <railtriage/core/triage_state.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace railtriage::core {

/// Mutable state of one triage run. Created per complaint; stages fill it in order.
struct TriageContext {
  const ComplaintInput* input{nullptr};
  std::uint64_t complaint_id{0};
  Timestamp received_at{};
  std::chrono::steady_clock::time_point started{};
  std::chrono::steady_clock::time_point deadline{};  // latency budget end
  const CancellationToken* cancel{nullptr};

  TriageState state{TriageState::Received};

  FeatureBundle bundle;
  ClassificationResult classification;
  std::string model_name;
  bool classifier_fallback{false};
  DedupOutcome dedup;
  RoutingDecision routing;
  ComplaintDecision decision;

  std::vector<std::string> notes;

  /// Time left until the latency budget is exhausted (never negative).
  [[nodiscard]] std::chrono::milliseconds remaining() const {
    const auto left = deadline - std::chrono::steady_clock::now();
    if (left <= std::chrono::steady_clock::duration::zero()) {
      return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(left);
  }

  [[nodiscard]] bool cancel_requested() const noexcept {
    return cancel != nullptr && cancel->cancelled();
  }
};

/// Abstract triage stage: advances the context to target_state() or fails.
class ITriageStage {
 public:
  virtual ~ITriageStage() = default;

  /// State the context is in after a successful process().
  [[nodiscard]] virtual TriageState target_state() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, TriageError> process(TriageContext& ctx) = 0;
};

}  // namespace railtriage::core
