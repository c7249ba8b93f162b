#include <railtriage/core/task_executor.hpp>
#include <algorithm>
#include <stdexcept>

namespace railtriage::core {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

TaskExecutor::TaskExecutor(std::size_t num_workers) {
  const std::size_t n = effective_workers(num_workers);
  workers_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

TaskExecutor::~TaskExecutor() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

std::size_t TaskExecutor::pending() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(std::count_if(
      jobs_.begin(), jobs_.end(), [](const Job& j) { return !j.is_abandoned(); }));
}

void TaskExecutor::enqueue(std::function<void()> run,
                           std::shared_ptr<std::atomic<bool>> abandoned) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      throw std::runtime_error("TaskExecutor: submit after shutdown");
    }
    // Drop stale entries at the back so a stalled worker does not let them pile up.
    while (!jobs_.empty() && jobs_.back().is_abandoned()) {
      jobs_.pop_back();
      skipped_.fetch_add(1);
    }
    jobs_.push_back(Job{std::move(run), std::move(abandoned)});
  }
  cv_.notify_one();
}

void TaskExecutor::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
      if (stopping_ && jobs_.empty()) break;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    if (job.is_abandoned()) {
      skipped_.fetch_add(1);
      continue;
    }
    // packaged_task stores any exception in the future.
    job.run();
  }
}

}  // namespace railtriage::core
