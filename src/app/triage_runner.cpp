#include <railtriage/app/triage_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace railtriage::app {

void triage_batch(const TriageOrchestrator& orchestrator,
                  const std::vector<core::ComplaintInput>& inputs,
                  const TriageResultCallback& callback) {
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    auto result = orchestrator.triage(inputs[i]);
    if (callback) callback(i, result);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void triage_batch_parallel(const TriageOrchestrator& orchestrator,
                           const std::vector<core::ComplaintInput>& inputs,
                           const TriageResultCallback& callback,
                           std::size_t num_workers) {
  const std::size_t n = inputs.size();
  if (n == 0) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    triage_batch(orchestrator, inputs, callback);
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      auto result = orchestrator.triage(inputs[idx]);
      if (callback) callback(idx, result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace railtriage::app
