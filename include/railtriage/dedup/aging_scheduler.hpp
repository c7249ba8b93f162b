#pragma once

#include <railtriage/dedup/cluster_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace railtriage::dedup {

struct AgingOptions {
  core::SystemClock::duration inactivity_window{std::chrono::hours(72)};
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds lock_timeout{50};
};

/// Periodic cluster aging, off the per-complaint path. One background thread calls
/// IClusterStore::sweep every `interval`; buckets it cannot lock are retried next run.
class ClusterAgingScheduler {
 public:
  using ClockFn = std::function<core::Timestamp()>;

  ClusterAgingScheduler(std::shared_ptr<IClusterStore> store, AgingOptions options,
                        ClockFn clock = [] { return core::SystemClock::now(); });
  ~ClusterAgingScheduler();

  ClusterAgingScheduler(const ClusterAgingScheduler&) = delete;
  ClusterAgingScheduler& operator=(const ClusterAgingScheduler&) = delete;

  /// Start the background thread. No-op if already running.
  void start();
  /// Stop and join. No-op if not running.
  void stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  /// One sweep on the calling thread.
  [[nodiscard]] std::expected<SweepReport, core::TriageError> run_once();

  [[nodiscard]] std::size_t runs() const noexcept { return runs_.load(); }

 private:
  void loop();

  std::shared_ptr<IClusterStore> store_;
  AgingOptions options_;
  ClockFn clock_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> runs_{0};
  std::thread thread_;
};

}  // namespace railtriage::dedup
