#pragma once

#include <railtriage/app/triage_orchestrator.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace railtriage::app {

using TriageResult = std::expected<core::ComplaintDecision, core::TriageError>;

/// Callback for each complaint of a batch: (index into the batch, result).
/// Must be thread-safe if using triage_batch_parallel.
using TriageResultCallback = std::function<void(std::size_t index, const TriageResult&)>;

/// Triages complaints sequentially; calls callback for each result (errors included).
void triage_batch(const TriageOrchestrator& orchestrator,
                  const std::vector<core::ComplaintInput>& inputs,
                  const TriageResultCallback& callback);

/// Triages complaints in parallel on a std::thread pool. Callback may be invoked
/// from any worker. num_workers 0 = use hardware concurrency.
void triage_batch_parallel(const TriageOrchestrator& orchestrator,
                           const std::vector<core::ComplaintInput>& inputs,
                           const TriageResultCallback& callback,
                           std::size_t num_workers = 0);

}  // namespace railtriage::app
