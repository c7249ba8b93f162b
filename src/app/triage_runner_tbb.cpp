#include <railtriage/app/triage_runner_tbb.hpp>

#ifdef RAILTRIAGE_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace railtriage::app {

void triage_batch_tbb(const TriageOrchestrator& orchestrator,
                      const std::vector<core::ComplaintInput>& inputs,
                      const TriageResultCallback& callback) {
  if (inputs.empty()) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, inputs.size()),
      [&orchestrator, &inputs, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = orchestrator.triage(inputs[i]);
          if (callback) callback(i, result);
        }
      });
}

}  // namespace railtriage::app

#endif  // RAILTRIAGE_HAS_TBB
