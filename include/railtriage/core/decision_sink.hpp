#pragma once

#include <railtriage/core/complaint.hpp>
#include <railtriage/core/error.hpp>
#include <expected>

namespace railtriage::core {

/// Downstream consumer of decisions (persistence or analytics collaborator).
/// publish() may be called from several triage threads at once.
class IDecisionSink {
 public:
  virtual ~IDecisionSink() = default;

  /// Return StorageUnavailable when the decision could not be made durable.
  [[nodiscard]] virtual std::expected<void, TriageError> publish(
      const ComplaintDecision& decision) = 0;
};

}  // namespace railtriage::core
