#pragma once

#include <railtriage/app/config.hpp>
#include <railtriage/app/triage_orchestrator.hpp>
#include <railtriage/core/decision_sink.hpp>
#include <railtriage/dedup/aging_scheduler.hpp>
#include <railtriage/dedup/in_memory_cluster_store.hpp>
#include <railtriage/media/ocr_engine.hpp>
#include <memory>

namespace railtriage::app {

/// A fully wired engine. The aging scheduler is created but not started.
struct TriageEngine {
  std::shared_ptr<dedup::InMemoryClusterStore> store;
  std::unique_ptr<TriageOrchestrator> orchestrator;
  std::unique_ptr<dedup::ClusterAgingScheduler> aging;
};

/// Build an engine from config. An ONNX model that cannot be loaded leaves the classifier
/// without a model (ModelUnavailable per request, absorbed when classifier_fallback is on);
/// an OCR backend that cannot be initialized disables OCR. Both are logged.
/// \param sink Optional decision sink (persistence/analytics).
/// \param ocr_override When set, used instead of the configured OCR backend (still time-bounded).
/// \throws std::invalid_argument if validate_config() fails.
[[nodiscard]] TriageEngine build_engine(const TriageConfig& config,
                                        std::shared_ptr<core::IDecisionSink> sink = nullptr,
                                        std::shared_ptr<media::IOcrEngine> ocr_override = nullptr);

}  // namespace railtriage::app
