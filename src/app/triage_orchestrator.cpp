#include <railtriage/app/triage_orchestrator.hpp>
#include "triage_stages.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace railtriage::app {

TriageOrchestrator::TriageOrchestrator(TriageComponents components,
                                       TriageOptions options,
                                       ClockFn clock)
    : components_(std::move(components)), options_(options), clock_(std::move(clock)) {
  if (!components_.extractor || !components_.classifier || !components_.router) {
    throw std::invalid_argument(
        "TriageOrchestrator: extractor, classifier and router are required");
  }
  if (!clock_) {
    throw std::invalid_argument("TriageOrchestrator: clock is required");
  }
  pipeline_.add_stage(std::make_unique<detail::ExtractStage>(components_.extractor));
  pipeline_.add_stage(std::make_unique<detail::ClassifyStage>(
      components_.classifier, components_.executor, options_));
  pipeline_.add_stage(std::make_unique<detail::DedupStage>(components_.deduplicator));
  pipeline_.add_stage(std::make_unique<detail::RouteStage>(components_.router));
  pipeline_.add_stage(std::make_unique<detail::PublishStage>(components_.sink));
}

std::expected<core::ComplaintDecision, core::TriageError> TriageOrchestrator::triage(
    const core::ComplaintInput& input,
    std::optional<std::chrono::milliseconds> latency_budget,
    const core::CancellationToken* cancel,
    core::StageTimingCallback* timing_cb) const {
  core::TriageContext ctx;
  ctx.input = &input;
  ctx.complaint_id = input.complaint_id ? *input.complaint_id : next_id_.fetch_add(1);
  ctx.received_at = clock_();
  ctx.started = std::chrono::steady_clock::now();
  ctx.deadline = ctx.started + latency_budget.value_or(options_.latency_budget);
  ctx.cancel = cancel;

  auto run = pipeline_.run(ctx, timing_cb);
  if (!run) {
    if (run.error() == core::TriageError::Cancelled) {
      spdlog::info("triage of complaint {} cancelled", ctx.complaint_id);
    } else {
      spdlog::error("triage of complaint {} failed: {}", ctx.complaint_id,
                    core::to_string(run.error()));
    }
    return std::unexpected(run.error());
  }
  return std::move(ctx.decision);
}

}  // namespace railtriage::app
