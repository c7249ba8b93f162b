#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace railtriage::core {

/// A queued task the caller may stop waiting for. abandon() makes the executor
/// drop the task if no worker has started it yet; a task already running finishes
/// and its result is discarded.
template <typename R>
struct Submission {
  std::future<R> future;
  std::shared_ptr<std::atomic<bool>> abandoned;

  void abandon() const noexcept {
    if (abandoned) abandoned->store(true);
  }
};

/// Fixed-size worker pool used to put a deadline on blocking collaborator calls
/// (model inference, OCR). submit_abandonable() returns a Submission whose future
/// the caller can wait_for(); a caller that gives up calls abandon() so the stale
/// task does not occupy a worker ahead of fresh requests.
///
/// Tasks must capture what they need by value (or shared_ptr): they may outlive the
/// caller's stack frame. The destructor runs the queued tasks that were not
/// abandoned and joins all workers.
class TaskExecutor {
 public:
  /// \param num_workers 0 = use hardware concurrency.
  explicit TaskExecutor(std::size_t num_workers = 0);
  ~TaskExecutor();

  TaskExecutor(const TaskExecutor&) = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;

  template <typename F>
  [[nodiscard]] auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    enqueue([task]() { (*task)(); }, nullptr);
    return fut;
  }

  template <typename F>
  [[nodiscard]] auto submit_abandonable(F&& fn) -> Submission<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    Submission<R> sub{task->get_future(), std::make_shared<std::atomic<bool>>(false)};
    enqueue([task]() { (*task)(); }, sub.abandoned);
    return sub;
  }

  [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }
  /// Queued tasks still wanted by their caller (abandoned ones are not counted).
  [[nodiscard]] std::size_t pending() const;
  /// Abandoned tasks dropped without running.
  [[nodiscard]] std::size_t skipped() const noexcept { return skipped_.load(); }

 private:
  struct Job {
    std::function<void()> run;
    std::shared_ptr<std::atomic<bool>> abandoned;

    [[nodiscard]] bool is_abandoned() const noexcept { return abandoned && abandoned->load(); }
  };

  void enqueue(std::function<void()> run, std::shared_ptr<std::atomic<bool>> abandoned);
  void worker_loop();

  std::vector<std::thread> workers_;
  std::deque<Job> jobs_;
  std::atomic<std::size_t> skipped_{0};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_{false};
};

}  // namespace railtriage::core
