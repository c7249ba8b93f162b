#include "cv_image_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstring>

namespace railtriage::media::detail {

std::optional<cv::Mat> decode_image(std::span<const std::byte> bytes) {
  if (bytes.empty()) return std::nullopt;
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  if (decoded.empty()) return std::nullopt;
  return decoded;
}

cv::Mat preprocess_for_ocr(const cv::Mat& image) {
  cv::Mat gray;
  switch (image.channels()) {
    case 1:
      gray = image;
      break;
    case 4:
      cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
      break;
    default:
      cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
      break;
  }
  if (gray.depth() != CV_8U) {
    cv::Mat converted;
    gray.convertTo(converted, CV_8U);
    gray = converted;
  }

  if (gray.cols == kOcrWidth && gray.rows == kOcrHeight) {
    return gray.clone();
  }
  cv::Mat resized;
  cv::resize(gray, resized, cv::Size(kOcrWidth, kOcrHeight), 0, 0, cv::INTER_LINEAR);
  return resized;
}

std::vector<std::byte> encode_png(const cv::Mat& image) {
  std::vector<uchar> buf;
  if (image.empty() || !cv::imencode(".png", image, buf)) {
    return {};
  }
  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

}  // namespace railtriage::media::detail
