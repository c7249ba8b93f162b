#include <railtriage/dedup/aging_scheduler.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace railtriage::dedup {

ClusterAgingScheduler::ClusterAgingScheduler(std::shared_ptr<IClusterStore> store,
                                             AgingOptions options, ClockFn clock)
    : store_(std::move(store)), options_(options), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("ClusterAgingScheduler: store is required");
  }
  if (options_.interval.count() <= 0) {
    throw std::invalid_argument("ClusterAgingScheduler: interval must be positive");
  }
}

ClusterAgingScheduler::~ClusterAgingScheduler() {
  stop();
}

void ClusterAgingScheduler::start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stop_requested_ = false;
  running_.store(true);
  thread_ = std::thread(&ClusterAgingScheduler::loop, this);
  spdlog::info("cluster aging started (interval {} ms)", options_.interval.count());
}

void ClusterAgingScheduler::stop() {
  std::thread t;
  {
    std::lock_guard lock(mutex_);
    if (!thread_.joinable()) return;
    stop_requested_ = true;
    t = std::move(thread_);
  }
  cv_.notify_all();
  t.join();
  running_.store(false);
  spdlog::info("cluster aging stopped after {} runs", runs_.load());
}

std::expected<SweepReport, core::TriageError> ClusterAgingScheduler::run_once() {
  auto report = store_->sweep(clock_(), options_.inactivity_window, options_.lock_timeout);
  runs_.fetch_add(1);
  if (!report) {
    spdlog::warn("cluster sweep failed: {}", core::to_string(report.error()));
    return report;
  }
  if (report->deferred > 0) {
    spdlog::warn("cluster sweep deferred {} buckets", report->deferred);
  }
  spdlog::debug("cluster sweep: examined {}, deactivated {}", report->examined,
                report->deactivated);
  return report;
}

void ClusterAgingScheduler::loop() {
  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, options_.interval, [this] { return stop_requested_; })) break;
    lock.unlock();
    (void)run_once();
    lock.lock();
  }
}

}  // namespace railtriage::dedup
