#include <railtriage/analytics/decision_log.hpp>

namespace railtriage::analytics {

std::expected<void, core::TriageError> DecisionLog::publish(
    const core::ComplaintDecision& decision) {
  std::lock_guard lock(mutex_);
  if (capacity_ > 0 && decisions_.size() >= capacity_) {
    decisions_.erase(decisions_.begin(),
                     decisions_.begin() + static_cast<std::ptrdiff_t>(decisions_.size() - capacity_ + 1));
  }
  decisions_.push_back(decision);
  return {};
}

std::vector<core::ComplaintDecision> DecisionLog::snapshot() const {
  std::lock_guard lock(mutex_);
  return decisions_;
}

std::size_t DecisionLog::size() const {
  std::lock_guard lock(mutex_);
  return decisions_.size();
}

void DecisionLog::clear() {
  std::lock_guard lock(mutex_);
  decisions_.clear();
}

}  // namespace railtriage::analytics
