#pragma once

#include <railtriage/core/error.hpp>
#include <railtriage/core/pipeline_stage.hpp>
#include <railtriage/core/triage_state.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace railtriage::core {

/// Callback for per-stage timing: (state reached or attempted, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(TriageState state, double duration_ms)>;

/// Runs a sequence of stages over one TriageContext.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<ITriageStage> stage);

  /// Run all stages in order. Cancellation is checked before every stage that would
  /// take the context up to Routed; once Routed, remaining stages always run.
  /// On failure the context is left in TriageState::Error.
  /// Thread-safe: safe to call run() from multiple threads with distinct contexts
  /// (stages keep no per-run state).
  [[nodiscard]] std::expected<void, TriageError> run(
      TriageContext& ctx,
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<ITriageStage>> stages_;
};

}  // namespace railtriage::core
