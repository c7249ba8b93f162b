#pragma once

#include <opencv2/core/mat.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace railtriage::media::detail {

/// OCR input geometry (grayscale, fixed size) used for every image and video frame.
inline constexpr int kOcrWidth = 640;
inline constexpr int kOcrHeight = 480;

/// Decode encoded image bytes (PNG/JPEG/...) to BGR or grayscale. nullopt if undecodable.
std::optional<cv::Mat> decode_image(std::span<const std::byte> bytes);

/// Grayscale + resize to kOcrWidth x kOcrHeight.
cv::Mat preprocess_for_ocr(const cv::Mat& image);

/// Encode as PNG (copy). Empty vector on failure.
std::vector<std::byte> encode_png(const cv::Mat& image);

}  // namespace railtriage::media::detail
