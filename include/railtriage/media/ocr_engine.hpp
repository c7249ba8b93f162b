#pragma once

#include <railtriage/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace railtriage::media {

/// OCR collaborator: encoded image bytes (PNG/JPEG/...) -> recognized text.
/// Failures are reported, never thrown; callers treat them as non-fatal.
class IOcrEngine {
 public:
  virtual ~IOcrEngine() = default;

  [[nodiscard]] virtual std::expected<std::string, core::TriageError> extract_text(
      std::span<const std::byte> image_bytes) = 0;

  [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace railtriage::media
