#pragma once

#include <railtriage/app/triage_runner.hpp>
#include <vector>

#ifdef RAILTRIAGE_HAS_TBB

namespace railtriage::app {

/// Triages a batch with tbb::parallel_for.
///
/// The orchestrator is shared by all TBB tasks; complaints for the same location may be
/// processed concurrently and are serialized by the cluster store's per-key locks.
/// \param callback Invoked for every complaint with (index, result). Must be thread-safe.
void triage_batch_tbb(const TriageOrchestrator& orchestrator,
                      const std::vector<core::ComplaintInput>& inputs,
                      const TriageResultCallback& callback);

}  // namespace railtriage::app

#endif  // RAILTRIAGE_HAS_TBB
