#pragma once

#include <cstdint>
#include <string_view>

namespace railtriage::core {

/// Per-complaint state machine. Error is reachable from any non-terminal state.
enum class TriageState : std::uint8_t {
  Received,
  Extracted,
  Classified,
  Deduped,
  Routed,
  Decided,
  Error,
};

[[nodiscard]] constexpr bool is_terminal(TriageState s) noexcept {
  return s == TriageState::Decided || s == TriageState::Error;
}

[[nodiscard]] constexpr std::string_view to_string(TriageState s) noexcept {
  switch (s) {
    case TriageState::Received: return "Received";
    case TriageState::Extracted: return "Extracted";
    case TriageState::Classified: return "Classified";
    case TriageState::Deduped: return "Deduped";
    case TriageState::Routed: return "Routed";
    case TriageState::Decided: return "Decided";
    case TriageState::Error: return "Error";
  }
  return "Unknown";
}

}  // namespace railtriage::core
