#include <railtriage/core/pipeline.hpp>
#include <chrono>

namespace railtriage::core {

void Pipeline::add_stage(std::unique_ptr<ITriageStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<void, TriageError> Pipeline::run(
    TriageContext& ctx,
    StageTimingCallback* timing_cb) const {
  if (stages_.empty()) {
    ctx.state = TriageState::Error;
    return std::unexpected(TriageError::InvalidConfig);
  }

  for (const auto& stage : stages_) {
    const TriageState target = stage->target_state();
    if (target <= TriageState::Routed && ctx.cancel_requested()) {
      ctx.state = TriageState::Error;
      return std::unexpected(TriageError::Cancelled);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stage->process(ctx);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
      (*timing_cb)(result ? target : TriageState::Error, ms);
    }

    if (!result) {
      ctx.state = TriageState::Error;
      return std::unexpected(result.error());
    }
    ctx.state = target;
  }
  return {};
}

}  // namespace railtriage::core
