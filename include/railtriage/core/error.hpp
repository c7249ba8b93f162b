#pragma once

#include <string_view>

namespace railtriage::core {

/// Triage error codes; used with std::expected across every layer boundary.
enum class TriageError {
  None = 0,
  ModelUnavailable,
  UnknownCategory,
  StorageUnavailable,
  Cancelled,
  Timeout,
  OcrFailed,
  MediaDecodeFailed,
  InvalidInput,
  InvalidConfig,
};

/// Fatal errors refuse intake for the request; everything else degrades.
[[nodiscard]] constexpr bool is_fatal(TriageError e) noexcept {
  switch (e) {
    case TriageError::ModelUnavailable:
    case TriageError::UnknownCategory:
    case TriageError::StorageUnavailable:
    case TriageError::Cancelled:
    case TriageError::InvalidConfig:
      return true;
    default:
      return false;
  }
}

[[nodiscard]] constexpr std::string_view to_string(TriageError e) noexcept {
  switch (e) {
    case TriageError::None: return "None";
    case TriageError::ModelUnavailable: return "ModelUnavailable";
    case TriageError::UnknownCategory: return "UnknownCategory";
    case TriageError::StorageUnavailable: return "StorageUnavailable";
    case TriageError::Cancelled: return "Cancelled";
    case TriageError::Timeout: return "Timeout";
    case TriageError::OcrFailed: return "OcrFailed";
    case TriageError::MediaDecodeFailed: return "MediaDecodeFailed";
    case TriageError::InvalidInput: return "InvalidInput";
    case TriageError::InvalidConfig: return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace railtriage::core
